/******************************************************************************\
 * ArchiveCodec.cpp - libarchive implementation of the archive codec
 *
 * Copyright 2024 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "tarzip_defs.h"

#include <stdexcept>

#include "useful/tarzip_log.h"

#include "ArchiveCodec.hpp"
#include "ConversionError.hpp"
#include "Tarball.hpp"
#include "ZipArchive.hpp"

namespace tarzip {

void
LibArchiveCodec::extractAll(std::string const& archivePath, std::string const& destDir) const
{
    try {
        auto tarball = Tarball{archivePath};
        auto const count = tarball.extractTo(destDir);
        getLogger().write("%s: extracted %zu entries to %s\n", archivePath.c_str(), count, destDir.c_str());
    } catch (std::exception const& ex) {
        throw ConversionError{ErrorKind::Extraction, ex.what()};
    }
}

void
LibArchiveCodec::compressAll(std::string const& sourceDir, std::string const& archivePath) const
{
    try {
        auto zip = ZipArchive{archivePath};
        zip.addTree(sourceDir);
        zip.finalize();
        getLogger().write("%s: wrote %s\n", sourceDir.c_str(), archivePath.c_str());
    } catch (std::exception const& ex) {
        throw ConversionError{ErrorKind::Compression, ex.what()};
    }
}

} /* namespace tarzip */

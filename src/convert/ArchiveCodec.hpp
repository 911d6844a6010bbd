/******************************************************************************\
 * ArchiveCodec.hpp - Interface to the archive formats used by the converter
 *
 * Copyright 2024 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <string>

namespace tarzip {

// Implementations must be safe to call from several threads at once, each
// thread working on its own paths.
class ArchiveCodec
{
public: // interface
    // Unpack a gzip compressed tar archive below destDir, which must already
    // exist. Throws ConversionError of kind Extraction.
    virtual void extractAll(std::string const& archivePath, std::string const& destDir) const = 0;

    // Write the contents of sourceDir, named relative to sourceDir, into a
    // zip archive at archivePath. Throws ConversionError of kind Compression.
    virtual void compressAll(std::string const& sourceDir, std::string const& archivePath) const = 0;

public: // Constructor/destructors
    virtual ~ArchiveCodec() = default;
};

// Codec backed by libarchive
class LibArchiveCodec : public ArchiveCodec
{
public: // inherited interface
    void extractAll(std::string const& archivePath, std::string const& destDir) const override;
    void compressAll(std::string const& sourceDir, std::string const& archivePath) const override;
};

} /* namespace tarzip */

/******************************************************************************\
 * ArchiveCodec.cpp - A mock archive codec implementation
 *
 * Copyright 2024 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "TestArchives.hpp"

#include "ArchiveCodec.hpp"

using ::testing::_;
using ::testing::Invoke;

/* MockCodec implementation */

MockCodec::MockCodec()
{
    // the payload records which archive it came from
    ON_CALL(*this, extractAll(_, _))
        .WillByDefault(Invoke([](std::string const& archivePath, std::string const& destDir) {
            writeFile(destDir + "/" + PAYLOAD_NAME, archivePath);
        }));

    ON_CALL(*this, compressAll(_, _))
        .WillByDefault(Invoke([](std::string const& sourceDir, std::string const& archivePath) {
            writeFile(archivePath, readFile(sourceDir + "/" + PAYLOAD_NAME));
        }));
}

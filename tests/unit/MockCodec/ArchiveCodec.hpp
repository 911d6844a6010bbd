/******************************************************************************\
 * ArchiveCodec.hpp - A mock archive codec implementation
 *
 * Copyright 2024 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <string>

#include "gmock/gmock.h"

#include "convert/ArchiveCodec.hpp"

// By default, extraction drops a single file into the destination and
// compression writes that file's contents to the archive path.
class MockCodec : public tarzip::ArchiveCodec
{
public: // types
    using Nice = ::testing::NiceMock<MockCodec>;

    static constexpr auto PAYLOAD_NAME = "payload.txt";

public: // mock constructor
    MockCodec();
    virtual ~MockCodec() = default;

public: // inherited interface
    MOCK_CONST_METHOD2(extractAll,  void(std::string const& archivePath, std::string const& destDir));
    MOCK_CONST_METHOD2(compressAll, void(std::string const& sourceDir, std::string const& archivePath));
};

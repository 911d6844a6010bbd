/******************************************************************************\
 * StagingDir.hpp - Owner of the directory an archive is unpacked into
 *
 * Copyright 2024 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>

#include <filesystem>
#include <string>
#include <system_error>

#include "useful/tarzip_log.h"
#include "useful/tarzip_wrappers.hpp"

#include "ConversionError.hpp"

namespace tarzip {

class StagingDir
{
public: // types
    static constexpr auto mode700 = int{S_IRUSR | S_IWUSR | S_IXUSR};

private: // variables
    std::string m_path;
    bool m_owned;

public: // interface
    std::string const& path() const { return m_path; }

    // Remove the directory and everything below it. Returns the error that
    // stopped removal, if any. Afterwards the directory is no longer owned.
    std::error_code remove()
    {
        auto ec = std::error_code{};
        if (m_owned) {
            m_owned = false;
            std::filesystem::remove_all(m_path, ec);
        }
        return ec;
    }

public: // Constructor/destructors
    // Create the staging directory. A leftover directory at the same path is
    // replaced only when replaceStale is set.
    StagingDir(std::string const& path, bool replaceStale)
        : m_path{path}
        , m_owned{false}
    {
        if (pathExists(m_path.c_str())) {
            if (!isDirectory(m_path.c_str())) {
                throw ConversionError{ErrorKind::StagingCreate,
                    m_path + " exists and is not a directory"};
            }
            if (!replaceStale) {
                throw ConversionError{ErrorKind::Collision,
                    m_path + " already exists (left over from an earlier run?)"};
            }

            auto ec = std::error_code{};
            std::filesystem::remove_all(m_path, ec);
            if (ec) {
                throw ConversionError{ErrorKind::StagingCreate,
                    "failed to remove stale " + m_path + ": " + ec.message()};
            }
            getLogger().write("removed stale staging directory %s\n", m_path.c_str());
        }

        if (::mkdir(m_path.c_str(), mode700)) {
            throw ConversionError{ErrorKind::StagingCreate,
                "mkdir " + m_path + " failed: " + strerror(errno)};
        }
        m_owned = true;
    }

    StagingDir(StagingDir const&) = delete;
    StagingDir& operator=(StagingDir const&) = delete;

    ~StagingDir()
    {
        if (auto const ec = remove()) {
            getLogger().write("warning: remove %s failed: %s\n", m_path.c_str(), ec.message().c_str());
        }
    }
};

} /* namespace tarzip */

/******************************************************************************\
 * Tarball.hpp - Read a gzip compressed tar archive and unpack it to disk
 *
 * Copyright 2024 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <archive.h>
#include <archive_entry.h>

#include <memory>
#include <string>

namespace tarzip {

class Tarball {
public: // types
    using ReadPtr  = std::unique_ptr<struct archive, decltype(&archive_read_free)>;
    using WritePtr = std::unique_ptr<struct archive, decltype(&archive_write_free)>;

private: // variables
    ReadPtr m_archPtr;
    std::string m_tarballPath;
    bool m_consumed;

private: // functions
    // copy the data blocks of the current entry to the disk writer
    void copyData(struct archive* disk, std::string const& entryPath);

public: // interface
    // Rewrite an archive entry path to a normalized relative path. Leading "./"
    // and empty components are dropped. Throws for absolute paths and paths
    // with ".." components. Returns empty for the archive root itself.
    static std::string normalizeEntryPath(std::string const& rawPath);

    // unpack every entry below destDir, which must exist. the archive stream
    // is consumed, so this can only be called once. returns the entry count
    size_t extractTo(std::string const& destDir);

    std::string const& path() const { return m_tarballPath; }

public: // Constructor/destructors
    // open the tarball for reading; throws if it is not a gzip compressed stream
    Tarball(std::string const& tarballPath);

    Tarball(Tarball&& expiring)
        : m_archPtr{std::move(expiring.m_archPtr)}
        , m_tarballPath{std::move(expiring.m_tarballPath)}
        , m_consumed{expiring.m_consumed}
    {}
};

} /* namespace tarzip */

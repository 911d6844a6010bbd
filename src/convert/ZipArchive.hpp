/******************************************************************************\
 * ZipArchive.hpp - Write a directory tree into a zip archive on disk
 *
 * Copyright 2024 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>

#include <archive.h>
#include <archive_entry.h>

#include <memory>
#include <string>

#include "tarzip_defs.h"

namespace tarzip {

class ZipArchive {
public: // types
    using ArchPtr  = std::unique_ptr<struct archive,       decltype(&archive_write_free)>;
    using EntryPtr = std::unique_ptr<struct archive_entry, decltype(&archive_entry_free)>;

private: // variables
    static constexpr size_t BLOCK_SIZE = TARZIP_BLOCK_SIZE;

    ArchPtr m_archPtr;
    EntryPtr m_entryScratchpad;
    std::unique_ptr<char[]> m_readBuf;
    std::string m_archivePath;
    bool m_finalized;

private: // functions
    // refresh the entry scratchpad without reallocating
    EntryPtr& freshEntry();
    // recursively add directory contents to archive, sorted by name
    void addDir(const std::string& entryPath, const std::string& dirPath);
    // block-copy file to archive
    void addFile(const std::string& entryPath, const std::string& filePath);

public: // interface
    // close the archive and return its path. after, only valid operation is to destruct
    const std::string& finalize();
    // add everything below dirPath, named relative to dirPath
    void addTree(const std::string& dirPath);
    // set up archive entry from lstat and call addDir / addFile / addLink
    void addPath(const std::string& entryPath, const std::string& path);
    // create symbolic link in archive, stamped from st or the current time
    void addLink(const std::string& entryPath, const std::string& dest, const struct stat* st = nullptr);

public: // Constructor/destructors
    // create archive on disk and set format
    ZipArchive(const std::string& archivePath);
    // remove archive from disk unless it was finalized
    ~ZipArchive() {
        if (!m_finalized && !m_archivePath.empty()) {
            m_archPtr.reset();
            unlink(m_archivePath.c_str());
        }
    }

    ZipArchive(ZipArchive&& expiring)
        : m_archPtr{std::move(expiring.m_archPtr)}
        , m_entryScratchpad{std::move(expiring.m_entryScratchpad)}
        , m_readBuf{std::move(expiring.m_readBuf)}
        , m_archivePath{std::move(expiring.m_archivePath)}
        , m_finalized{expiring.m_finalized}
    {
        expiring.m_archivePath.clear();
    }
};

} /* namespace tarzip */

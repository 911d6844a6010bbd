/******************************************************************************\
 * ZipArchive.cpp - Write a directory tree into a zip archive on disk
 *
 * Copyright 2024 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "tarzip_defs.h"

#include <dirent.h>
#include <string.h>
#include <sys/stat.h>
#include <time.h>

#include <algorithm>
#include <stdexcept>
#include <vector>

#include <archive.h>
#include <archive_entry.h>

#include "useful/tarzip_log.h"
#include "useful/tarzip_wrappers.hpp"

#include "ZipArchive.hpp"

namespace tarzip {

using EntryPtr = ZipArchive::EntryPtr;

EntryPtr& ZipArchive::freshEntry() {
    if (m_entryScratchpad) {
        archive_entry_clear(m_entryScratchpad.get());
        return m_entryScratchpad;
    } else {
        throw std::runtime_error(m_archivePath + " tried to add a path after finalizing");
    }
}

ZipArchive::ZipArchive(const std::string& archivePath)
    : m_archPtr{archive_write_new(), archive_write_free}
    , m_entryScratchpad{archive_entry_new(), archive_entry_free}
    , m_readBuf{new char[BLOCK_SIZE]}
    , m_archivePath{}
    , m_finalized{false}
{
    if ((m_archPtr == nullptr) || (m_entryScratchpad == nullptr)) {
        throw std::runtime_error("archive_write_new failed");
    }

    if (archive_write_set_format_zip(m_archPtr.get()) != ARCHIVE_OK) {
        throw std::runtime_error(archive_error_string(m_archPtr.get()));
    }

    // deflate is only unavailable if libarchive was built without zlib
    if (archive_write_set_format_option(m_archPtr.get(), "zip", "compression", "deflate") != ARCHIVE_OK) {
        getLogger().write("%s: deflate unavailable, storing entries: %s\n",
            archivePath.c_str(), archive_error_string(m_archPtr.get()));
    }

    if (archive_write_open_filename(m_archPtr.get(), archivePath.c_str()) != ARCHIVE_OK) {
        throw std::runtime_error(archivePath + ": " + archive_error_string(m_archPtr.get()));
    }

    // file now exists on disk and is ours to remove
    m_archivePath = archivePath;
}

static void archiveWriteRetry(struct archive* arch, struct archive_entry* entry) {
    while (true) {
        switch (archive_write_header(arch, entry)) {
            case ARCHIVE_RETRY:
                continue;
            case ARCHIVE_WARN:
                getLogger().write("%s: %s\n", archive_entry_pathname(entry), archive_error_string(arch));
                return;
            case ARCHIVE_FAILED:
            case ARCHIVE_FATAL:
                throw std::runtime_error(std::string{archive_entry_pathname(entry)} + ": "
                    + archive_error_string(arch));
            default: return;
        }
    }
}

const std::string& ZipArchive::finalize() {
    if (m_finalized) {
        return m_archivePath;
    }

    // write the central directory
    if (m_archPtr && (archive_write_close(m_archPtr.get()) != ARCHIVE_OK)) {
        throw std::runtime_error(m_archivePath + " failed to close: "
            + archive_error_string(m_archPtr.get()));
    }

    m_archPtr.reset();
    m_entryScratchpad.reset();
    m_readBuf.reset();
    m_finalized = true;

    return m_archivePath;
}

void ZipArchive::addLink(const std::string& entryPath, const std::string& dest, const struct stat* st) {
    auto& entryPtr = freshEntry();

    if (st != nullptr) {
        // keep the times and owner of the link itself
        archive_entry_copy_stat(entryPtr.get(), st);
    } else {
        // get the current time
        struct timespec tv;
        clock_gettime(CLOCK_REALTIME, &tv);

        archive_entry_set_atime(entryPtr.get(), tv.tv_sec, tv.tv_nsec);
        archive_entry_set_ctime(entryPtr.get(), tv.tv_sec, tv.tv_nsec);
        archive_entry_set_mtime(entryPtr.get(), tv.tv_sec, tv.tv_nsec);
    }

    // setup the archive header
    archive_entry_set_pathname(entryPtr.get(), entryPath.c_str());
    archive_entry_set_filetype(entryPtr.get(), AE_IFLNK);
    archive_entry_set_symlink (entryPtr.get(), dest.c_str());
    archive_entry_set_size    (entryPtr.get(), 0);
    archive_entry_set_perm    (entryPtr.get(), S_IRWXU | S_IRWXG | S_IRWXO);

    archiveWriteRetry(m_archPtr.get(), entryPtr.get());
}

void ZipArchive::addDir(const std::string& entryPath, const std::string& dirPath) {
    // collect names first so the archive layout does not depend on readdir order
    auto names = std::vector<std::string>{};
    { auto const dirHandle = dir::open(dirPath);
        errno = 0;
        for (struct dirent *d = readdir(dirHandle.get()); d != nullptr;
            d = readdir(dirHandle.get())) {

            // make sure not . or ..
            if (!strcmp(d->d_name, ".") || !strcmp(d->d_name, "..")) {
                continue;
            }

            names.emplace_back(d->d_name);
        }

        // check for failure on readdir
        if (errno != 0) {
            throw std::runtime_error(dirPath + " had readdir failure: " +
                strerror(errno));
        }
    }
    std::sort(names.begin(), names.end());

    // recursively add to archive
    for (auto&& name : names) {
        addPath(entryPath.empty() ? name : entryPath + "/" + name, dirPath + "/" + name);
    }
}

void ZipArchive::addTree(const std::string& dirPath) {
    addDir("", dirPath);
}

void ZipArchive::addFile(const std::string& entryPath, const std::string& filePath) {
    // copy data from file to archive
    auto const rawFd = ::open(filePath.c_str(), O_RDONLY);
    if (rawFd < 0) {
        throw std::runtime_error(filePath + " failed open call: " + strerror(errno));
    }
    auto const fdHandle = fd_handle{rawFd};
    while (true) {
        auto const readLen = ::read(fdHandle.fd(), m_readBuf.get(), BLOCK_SIZE);
        if (readLen < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::runtime_error(filePath + " failed read call: " + strerror(errno));
        } else if (readLen == 0) {
            break;
        }

        auto const writeLen = archive_write_data(m_archPtr.get(), m_readBuf.get(), readLen);
        if (writeLen < 0) {
            throw std::runtime_error(filePath + " failed archive_write_data: " +
                archive_error_string(m_archPtr.get()));
        } else if (writeLen != readLen) {
            throw std::runtime_error(entryPath +
                " had archive_write_data length mismatch.");
        }
    }
}

void ZipArchive::addPath(const std::string& entryPath, const std::string& path) {
    struct stat st;
    if (lstat(path.c_str(), &st)) {
        throw std::runtime_error(path + " failed stat call");
    }

    if (S_ISLNK(st.st_mode)) {
        addLink(entryPath, cstr::readlink(path), &st);
        return;
    }

    if (!S_ISDIR(st.st_mode) && !S_ISREG(st.st_mode)) {
        // pipes, sockets and device nodes have no zip representation
        throw std::runtime_error(path + " has invalid file type.");
    }

    // create archive entry from stat
    { auto& entryPtr = freshEntry();
        archive_entry_copy_stat(entryPtr.get(), &st);
        if (S_ISDIR(st.st_mode)) {
            archive_entry_set_pathname(entryPtr.get(), (entryPath + "/").c_str());
            archive_entry_set_size(entryPtr.get(), 0);
        } else {
            archive_entry_set_pathname(entryPtr.get(), entryPath.c_str());
        }
        archiveWriteRetry(m_archPtr.get(), entryPtr.get());
    }

    // call proper file/diradd functions
    if (S_ISDIR(st.st_mode)) {
        addDir(entryPath, path);
    } else {
        addFile(entryPath, path);
    }
}

} /* namespace tarzip */

/******************************************************************************\
 * Tarball.cpp - Read a gzip compressed tar archive and unpack it to disk
 *
 * Copyright 2024 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "tarzip_defs.h"

#include <sys/stat.h>

#include <sstream>
#include <stdexcept>

#include <archive.h>
#include <archive_entry.h>

#include "useful/tarzip_log.h"
#include "useful/tarzip_wrappers.hpp"

#include "Tarball.hpp"

namespace tarzip {

Tarball::Tarball(std::string const& tarballPath)
    : m_archPtr{archive_read_new(), archive_read_free}
    , m_tarballPath{tarballPath}
    , m_consumed{false}
{
    if (m_archPtr == nullptr) {
        throw std::runtime_error("archive_read_new failed");
    }

    if (!fileHasPerms(m_tarballPath.c_str(), R_OK)) {
        throw std::runtime_error(m_tarballPath + " is not a readable regular file");
    }

    // ARCHIVE_WARN means gzip will be run as an external program
    if (archive_read_support_filter_gzip(m_archPtr.get()) < ARCHIVE_WARN) {
        throw std::runtime_error(archive_error_string(m_archPtr.get()));
    }
    // covers ustar, pax and GNU tar
    if (archive_read_support_format_tar(m_archPtr.get()) != ARCHIVE_OK) {
        throw std::runtime_error(archive_error_string(m_archPtr.get()));
    }

    if (archive_read_open_filename(m_archPtr.get(), m_tarballPath.c_str(), TARZIP_BLOCK_SIZE) != ARCHIVE_OK) {
        throw std::runtime_error(m_tarballPath + ": " + archive_error_string(m_archPtr.get()));
    }

    // the read filter chain is decided on open. a bare tar is not accepted
    if (archive_filter_code(m_archPtr.get(), 0) != ARCHIVE_FILTER_GZIP) {
        throw std::runtime_error(m_tarballPath + ": not in gzip format");
    }
}

std::string Tarball::normalizeEntryPath(std::string const& rawPath)
{
    if (!rawPath.empty() && (rawPath[0] == '/')) {
        throw std::runtime_error(rawPath + ": absolute path in archive");
    }

    auto result = std::string{};
    auto components = std::istringstream{rawPath};
    auto component = std::string{};
    while (std::getline(components, component, '/')) {
        if (component.empty() || (component == ".")) {
            continue;
        }
        if (component == "..") {
            throw std::runtime_error(rawPath + ": path leaves the extraction directory");
        }
        if (!result.empty()) {
            result.push_back('/');
        }
        result += component;
    }

    return result;
}

void Tarball::copyData(struct archive* disk, std::string const& entryPath)
{
    const void *buff = nullptr;
    size_t size = 0;
    la_int64_t offset = 0;

    while (true) {
        auto rc = archive_read_data_block(m_archPtr.get(), &buff, &size, &offset);
        if (rc == ARCHIVE_EOF) {
            return;
        } else if (rc < ARCHIVE_WARN) {
            throw std::runtime_error(m_tarballPath + ": " + entryPath + ": "
                + archive_error_string(m_archPtr.get()));
        }

        rc = archive_write_data_block(disk, buff, size, offset);
        if (rc < ARCHIVE_WARN) {
            throw std::runtime_error(entryPath + ": " + archive_error_string(disk));
        }
    }
}

size_t Tarball::extractTo(std::string const& destDir)
{
    if (m_consumed) {
        throw std::runtime_error(m_tarballPath + " was already extracted");
    }
    m_consumed = true;

    // the secure extraction checks cover the whole path, not only the entry
    auto const realDestDir = getRealPath(destDir);

    auto const diskPtr = WritePtr{archive_write_disk_new(), archive_write_free};
    if (diskPtr == nullptr) {
        throw std::runtime_error("archive_write_disk_new failed");
    }

    // entry paths are validated below, libarchive guards against links
    // being used to escape destDir
    auto const flags = ARCHIVE_EXTRACT_TIME
        | ARCHIVE_EXTRACT_PERM
        | ARCHIVE_EXTRACT_SECURE_NODOTDOT
        | ARCHIVE_EXTRACT_SECURE_SYMLINKS;
    archive_write_disk_set_options(diskPtr.get(), flags);
    archive_write_disk_set_standard_lookup(diskPtr.get());

    size_t count = 0;
    while (true) {
        struct archive_entry *entry = nullptr;
        auto rc = archive_read_next_header(m_archPtr.get(), &entry);
        if (rc == ARCHIVE_EOF) {
            break;
        } else if (rc == ARCHIVE_WARN) {
            getLogger().write("%s: %s\n", m_tarballPath.c_str(), archive_error_string(m_archPtr.get()));
        } else if (rc != ARCHIVE_OK) {
            throw std::runtime_error(m_tarballPath + ": " + archive_error_string(m_archPtr.get()));
        }

        auto const rawPath = archive_entry_pathname(entry);
        if (rawPath == nullptr) {
            throw std::runtime_error(m_tarballPath + ": entry without a path name");
        }
        auto const relPath = normalizeEntryPath(rawPath);
        if (relPath.empty()) {
            // the "./" entry for the archive root is destDir itself
            archive_read_data_skip(m_archPtr.get());
            continue;
        }
        archive_entry_set_pathname(entry, (realDestDir + "/" + relPath).c_str());

        if (auto const hardlink = archive_entry_hardlink(entry)) {
            // carries no file type of its own, the target was unpacked earlier
            auto const linkPath = normalizeEntryPath(hardlink);
            if (linkPath.empty()) {
                throw std::runtime_error(relPath + ": hard link to the archive root");
            }
            archive_entry_set_hardlink(entry, (realDestDir + "/" + linkPath).c_str());
        } else {
            // the tree is read back and removed afterwards, so the owner must
            // keep access to everything that is unpacked
            switch (archive_entry_filetype(entry)) {
                case AE_IFDIR:
                    archive_entry_set_perm(entry, archive_entry_perm(entry) | S_IRWXU);
                    break;
                case AE_IFREG:
                    archive_entry_set_perm(entry, archive_entry_perm(entry) | S_IRUSR | S_IWUSR);
                    break;
                case AE_IFLNK:
                    break;
                default:
                    throw std::runtime_error(relPath + ": unsupported entry type");
            }
        }

        rc = archive_write_header(diskPtr.get(), entry);
        if (rc == ARCHIVE_WARN) {
            getLogger().write("%s: %s\n", relPath.c_str(), archive_error_string(diskPtr.get()));
        } else if (rc != ARCHIVE_OK) {
            throw std::runtime_error(relPath + ": " + archive_error_string(diskPtr.get()));
        }

        if (archive_entry_size(entry) > 0) {
            copyData(diskPtr.get(), relPath);
        }

        rc = archive_write_finish_entry(diskPtr.get());
        if (rc < ARCHIVE_WARN) {
            throw std::runtime_error(relPath + ": " + archive_error_string(diskPtr.get()));
        }

        getLogger().write("extracted %s\n", relPath.c_str());
        ++count;
    }

    // applies deferred directory permissions and times
    if (archive_write_close(diskPtr.get()) != ARCHIVE_OK) {
        throw std::runtime_error(destDir + ": " + archive_error_string(diskPtr.get()));
    }

    return count;
}

} /* namespace tarzip */

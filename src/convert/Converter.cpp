/******************************************************************************\
 * Converter.cpp - Batch conversion of compressed tar archives to zip archives
 *
 * Copyright 2024 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "tarzip_defs.h"

#include <dirent.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <future>
#include <mutex>
#include <stdexcept>
#include <unordered_map>

#include <boost/algorithm/string/predicate.hpp>

#include "useful/tarzip_log.h"
#include "useful/tarzip_wrappers.hpp"

#include "Converter.hpp"
#include "StagingDir.hpp"

namespace tarzip {

namespace {

// An output archive while it is being written. The file is created next to
// its final location so that publishing it is a rename on one filesystem.
class PartialOutput
{
private: // variables
    std::string m_path;
    bool m_pending;

public: // interface
    std::string const& path() const { return m_path; }

    // Move the finished archive to dest. Without overwrite an existing dest is
    // left untouched and reported as a collision.
    void commit(std::string const& dest, bool overwrite)
    {
        if (overwrite) {
            if (::rename(m_path.c_str(), dest.c_str())) {
                throw ConversionError{ErrorKind::Compression,
                    "rename " + m_path + " to " + dest + " failed: " + strerror(errno)};
            }
        } else {
            // link fails rather than replace an archive that appeared meanwhile
            if (::link(m_path.c_str(), dest.c_str())) {
                if (errno == EEXIST) {
                    throw ConversionError{ErrorKind::Collision, dest + " already exists"};
                }
                throw ConversionError{ErrorKind::Compression,
                    "link " + m_path + " to " + dest + " failed: " + strerror(errno)};
            }
            ::unlink(m_path.c_str());
        }
        m_pending = false;
    }

public: // Constructor/destructors
    PartialOutput(std::string const& outputDir, std::string const& base, mode_t mode)
        : m_path{}
        , m_pending{false}
    {
        auto const pathTemplate = outputDir + "/" + TARZIP_PARTIAL_PREFIX + base
            + TARZIP_OUTPUT_SUFFIX + TARZIP_PARTIAL_SUFFIX;
        auto const [path, rawFd] = cstr::mkstemp(pathTemplate);
        auto const fdHandle = fd_handle{rawFd};
        m_path = path;
        m_pending = true;

        // mkstemp creates the file private to the owner
        if (::fchmod(fdHandle.fd(), mode)) {
            getLogger().write("warning: chmod %s failed: %s\n", m_path.c_str(), strerror(errno));
        }
    }

    PartialOutput(PartialOutput const&) = delete;
    PartialOutput& operator=(PartialOutput const&) = delete;

    ~PartialOutput()
    {
        if (m_pending && ::unlink(m_path.c_str()) && (errno != ENOENT)) {
            getLogger().write("warning: unlink %s failed: %s\n", m_path.c_str(), strerror(errno));
        }
    }
};

} /* anonymous namespace */

size_t
BatchSummary::count(ConversionStatus status) const
{
    return std::count_if(results.begin(), results.end(),
        [status](ConversionResult const& result) { return result.status == status; });
}

std::optional<std::string>
stripArchiveSuffix(std::string const& fileName)
{
    for (auto&& suffix : { TARZIP_INPUT_SUFFIX, TARZIP_INPUT_SHORT_SUFFIX }) {
        auto const suffixLen = ::strlen(suffix);
        if ((fileName.length() > suffixLen) && boost::algorithm::ends_with(fileName, suffix)) {
            return fileName.substr(0, fileName.length() - suffixLen);
        }
    }
    return std::nullopt;
}

ArchiveConverter::ArchiveConverter(ConverterConfig config, ArchiveCodec const& codec)
    : m_config{std::move(config)}
    , m_codec{codec}
    , m_outputMode{0}
{
    if (m_config.inputDir.empty()) {
        throw std::runtime_error("no input directory was provided");
    }
    if (m_config.outputDir.empty()) {
        m_config.outputDir = m_config.inputDir;
    }
    if (m_config.jobs < 1) {
        throw std::runtime_error("at least one job is required");
    }

    if (!dirHasPerms(m_config.inputDir.c_str(), R_OK | X_OK)) {
        throw std::runtime_error("input directory " + m_config.inputDir + " is not a readable directory");
    }
    if (!dirHasPerms(m_config.outputDir.c_str(), W_OK | X_OK)) {
        throw std::runtime_error("output directory " + m_config.outputDir + " is not a writable directory");
    }

    // extraction refuses paths with .. components or symlinks in them
    m_config.inputDir  = getRealPath(m_config.inputDir);
    m_config.outputDir = getRealPath(m_config.outputDir);

    // archives are published with the mode a new file gets under the umask
    auto const mask = ::umask(0);
    ::umask(mask);
    m_outputMode = (S_IRUSR | S_IWUSR | S_IRGRP | S_IWGRP | S_IROTH | S_IWOTH) & ~mask;
}

std::string
ArchiveConverter::stagingPathFor(InputArchive const& input) const
{
    return m_config.outputDir + "/" + input.base + TARZIP_STAGE_SUFFIX;
}

std::string
ArchiveConverter::outputPathFor(InputArchive const& input) const
{
    return m_config.outputDir + "/" + input.base + TARZIP_OUTPUT_SUFFIX;
}

std::vector<InputArchive>
ArchiveConverter::scan() const
{
    auto result = std::vector<InputArchive>{};

    { auto const dirHandle = dir::open(m_config.inputDir);
        errno = 0;
        for (struct dirent *d = readdir(dirHandle.get()); d != nullptr;
            d = readdir(dirHandle.get())) {

            auto const name = std::string{d->d_name};
            auto base = stripArchiveSuffix(name);
            if (!base) {
                continue;
            }

            // follow symlinks, the tarball itself must be a regular file
            auto const path = m_config.inputDir + "/" + name;
            struct stat st;
            if (::stat(path.c_str(), &st) || !S_ISREG(st.st_mode)) {
                getLogger().write("skipping %s: not a regular file\n", path.c_str());
                errno = 0;
                continue;
            }

            result.push_back(InputArchive{path, name, std::move(*base)});
        }

        // check for failure on readdir
        if (errno != 0) {
            throw std::runtime_error(m_config.inputDir + " had readdir failure: " + strerror(errno));
        }
    }

    std::sort(result.begin(), result.end(),
        [](InputArchive const& lhs, InputArchive const& rhs) { return lhs.name < rhs.name; });

    getLogger().write("found %zu archives in %s\n", result.size(), m_config.inputDir.c_str());
    return result;
}

ConversionResult
ArchiveConverter::collisionResult(InputArchive const& input, InputArchive const& owner) const
{
    auto result = ConversionResult{};
    result.input     = input.path;
    result.output    = outputPathFor(input);
    result.status    = ConversionStatus::Failed;
    result.errorKind = ErrorKind::Collision;
    result.message   = "base name " + input.base + " is already used by " + owner.name;
    return result;
}

ConversionResult
ArchiveConverter::convert(InputArchive const& input) const
{
    auto result = ConversionResult{};
    result.input  = input.path;
    result.output = outputPathFor(input);

    auto const overwrite = (m_config.overwrite == OverwritePolicy::Overwrite);

    // stage that is blamed for anything other than a ConversionError
    auto stage = ErrorKind::StagingCreate;
    auto staging = std::optional<StagingDir>{};

    getLogger().write("converting %s -> %s\n", result.input.c_str(), result.output.c_str());
    try {
        if (isDirectory(result.output.c_str())) {
            throw ConversionError{ErrorKind::Collision, result.output + " is a directory"};
        }
        if (!overwrite && pathExists(result.output.c_str())) {
            throw ConversionError{ErrorKind::Collision, result.output + " already exists"};
        }

        staging.emplace(stagingPathFor(input), overwrite);

        stage = ErrorKind::Extraction;
        m_codec.extractAll(input.path, staging->path());

        stage = ErrorKind::Compression;
        auto partial = PartialOutput{m_config.outputDir, input.base, m_outputMode};
        m_codec.compressAll(staging->path(), partial.path());
        partial.commit(result.output, overwrite);

        result.status = ConversionStatus::Succeeded;
    } catch (ConversionError const& ex) {
        result.status    = ConversionStatus::Failed;
        result.errorKind = ex.kind();
        result.message   = ex.what();
    } catch (std::exception const& ex) {
        result.status    = ConversionStatus::Failed;
        result.errorKind = stage;
        result.message   = ex.what();
    }

    // cleanup failure does not undo a finished archive
    if (staging) {
        if (auto const ec = staging->remove()) {
            result.warnings.push_back(std::string{errorKindName(ErrorKind::Cleanup)}
                + ": failed to remove " + staging->path() + ": " + ec.message());
        }
    }

    if (result.status == ConversionStatus::Succeeded) {
        getLogger().write("converted %s\n", result.input.c_str());
    } else {
        getLogger().write("%s failed: %s: %s\n", result.input.c_str(),
            errorKindName(*result.errorKind), result.message.c_str());
    }
    for (auto&& warning : result.warnings) {
        getLogger().write("%s: %s\n", result.input.c_str(), warning.c_str());
    }

    return result;
}

BatchSummary
ArchiveConverter::convertAll(ResultCallback onResult) const
{
    auto const inputs = scan();

    auto summary = BatchSummary{};
    summary.results.resize(inputs.size());

    auto resultMutex = std::mutex{};
    auto const publish = [&](size_t idx) {
        if (onResult) {
            auto const lock = std::lock_guard<std::mutex>{resultMutex};
            onResult(summary.results[idx]);
        }
    };

    // each base name is claimed by the first archive in scan order
    auto owners = std::unordered_map<std::string, size_t>{};
    auto work = std::vector<size_t>{};
    auto hasCollision = false;
    for (size_t idx = 0; idx < inputs.size(); ++idx) {
        auto const [owner, claimed] = owners.emplace(inputs[idx].base, idx);
        if (claimed) {
            summary.results[idx].input  = inputs[idx].path;
            summary.results[idx].output = outputPathFor(inputs[idx]);
            work.push_back(idx);
        } else {
            summary.results[idx] = collisionResult(inputs[idx], inputs[owner->second]);
            hasCollision = true;
            publish(idx);
        }
    }

    auto next = std::atomic<size_t>{0};
    auto stop = std::atomic<bool>{m_config.failFast && hasCollision};

    auto const worker = [&]() {
        while (!stop.load()) {
            auto const slot = next.fetch_add(1);
            if (slot >= work.size()) {
                break;
            }

            auto const idx = work[slot];
            summary.results[idx] = convert(inputs[idx]);
            if (m_config.failFast && (summary.results[idx].status == ConversionStatus::Failed)) {
                stop.store(true);
            }
            publish(idx);
        }
    };

    auto const numWorkers = std::min<size_t>(m_config.jobs, work.size());
    if (numWorkers <= 1) {
        worker();
    } else {
        getLogger().write("converting %zu archives with %zu workers\n", work.size(), numWorkers);

        // each worker owns the staging directory of the archive it converts
        auto workers = std::vector<std::future<void>>{};
        workers.reserve(numWorkers);
        for (size_t i = 0; i < numWorkers; ++i) {
            workers.emplace_back(std::async(std::launch::async, worker));
        }

        // collect
        for (auto&& future : workers) {
            future.get();
        }
    }

    // anything left unclaimed was skipped by fail-fast
    for (auto&& result : summary.results) {
        if (result.status == ConversionStatus::Skipped) {
            result.message = "not attempted after an earlier failure";
        }
    }

    return summary;
}

} /* namespace tarzip */

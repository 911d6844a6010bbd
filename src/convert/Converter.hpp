/******************************************************************************\
 * Converter.hpp - Batch conversion of compressed tar archives to zip archives
 *
 * Copyright 2024 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <sys/types.h>

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "ArchiveCodec.hpp"
#include "ConversionError.hpp"

namespace tarzip {

// What to do when an output archive or staging directory already exists
enum class OverwritePolicy {
    Refuse,
    Overwrite,
};

struct ConverterConfig
{
    std::string inputDir;
    std::string outputDir; // empty: same as inputDir
    OverwritePolicy overwrite = OverwritePolicy::Refuse;
    unsigned jobs = 1;
    bool failFast = false;
};

struct InputArchive
{
    std::string path; // full path to the tarball
    std::string name; // file name within the input directory
    std::string base; // file name without its archive suffix
};

enum class ConversionStatus {
    Succeeded,
    Failed,
    Skipped, // not started because an earlier conversion failed in fail-fast mode
};

struct ConversionResult
{
    std::string input;
    std::string output;
    ConversionStatus status = ConversionStatus::Skipped;
    std::optional<ErrorKind> errorKind;
    std::string message;
    std::vector<std::string> warnings;
};

struct BatchSummary
{
    std::vector<ConversionResult> results; // in scan order

    size_t count(ConversionStatus status) const;
    size_t succeeded() const { return count(ConversionStatus::Succeeded); }
    size_t failed()    const { return count(ConversionStatus::Failed); }
    size_t skipped()   const { return count(ConversionStatus::Skipped); }
    bool ok() const { return failed() == 0; }
};

// Strip a recognized compressed tar suffix from a file name. Returns nothing
// if the name has no such suffix or nothing is left after stripping it.
std::optional<std::string> stripArchiveSuffix(std::string const& fileName);

class ArchiveConverter
{
public: // types
    using ResultCallback = std::function<void(ConversionResult const&)>;

private: // variables
    ConverterConfig m_config;
    ArchiveCodec const& m_codec;
    mode_t m_outputMode; // of published archives

private: // functions
    ConversionResult collisionResult(InputArchive const& input, InputArchive const& owner) const;

public: // interface
    // directories are stored resolved to their real paths
    ConverterConfig const& config() const { return m_config; }

    std::string stagingPathFor(InputArchive const& input) const;
    std::string outputPathFor(InputArchive const& input) const;

    // List the archives of the input directory, sorted by file name
    std::vector<InputArchive> scan() const;

    // Run the full pipeline for one archive. Never throws for a failed
    // conversion; the failure is described by the result.
    ConversionResult convert(InputArchive const& input) const;

    // Scan and convert everything. onResult is called once per archive as
    // conversions finish, never concurrently.
    BatchSummary convertAll(ResultCallback onResult = nullptr) const;

public: // Constructor/destructors
    // throws std::runtime_error if the configured directories are unusable
    ArchiveConverter(ConverterConfig config, ArchiveCodec const& codec);
};

} /* namespace tarzip */

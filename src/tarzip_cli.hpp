/******************************************************************************\
 * tarzip_cli.hpp - Command line handling for the tarzip driver
 *
 * Copyright 2024 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <ostream>
#include <stdexcept>
#include <string>

#include "convert/ArchiveCodec.hpp"
#include "convert/Converter.hpp"

namespace tarzip {

// bad command line or environment, reported with exit status TARZIP_EXIT_USAGE
class UsageError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

struct CommandLineOptions
{
    ConverterConfig config;
    bool debug = false;
    bool dryRun = false;
    bool quiet = false;
    bool help = false;
    std::string reportPath;
};

// parse a positive job count. throws UsageError
unsigned parseJobs(std::string const& jobsStr);

// jobsEnv is the value of TARZIP_JOBS, or null if unset. --jobs overrides it.
// parsing stops at --help. throws UsageError
CommandLineOptions parseCommandLine(int argc, char* const* argv, char const* jobsEnv);

// one "input -> output" line per archive, with collision markers. reads the
// input directory only
void printPlan(std::ostream& out, ArchiveConverter const& converter);

// convert everything, print results as they finish and the closing summary,
// write the report if requested. returns the process exit status
int runConversions(ArchiveConverter const& converter, CommandLineOptions const& options,
    std::ostream& out, std::ostream& err);

// build the converter from options, then plan or convert. returns the process
// exit status
int runCommandLine(CommandLineOptions options, ArchiveCodec const& codec,
    std::ostream& out, std::ostream& err);

} /* namespace tarzip */

/******************************************************************************\
 * tarzip.cpp - Convert every compressed tar archive in a directory into a zip
 *              archive of the same name.
 *
 * Copyright 2024 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "tarzip_defs.h"

#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <exception>
#include <iostream>
#include <utility>

#include "tarzip_argv_defs.hpp"
#include "tarzip_cli.hpp"
#include "useful/tarzip_log.h"

#include "convert/ArchiveCodec.hpp"

using namespace tarzip;

static void
usage(char *name)
{
    fprintf(stdout, "Usage: %s [OPTIONS]...\n", name);
    fprintf(stdout, "Convert each %s or %s archive in a directory into a %s archive\n",
        TARZIP_INPUT_SUFFIX, TARZIP_INPUT_SHORT_SUFFIX, TARZIP_OUTPUT_SUFFIX);
    fprintf(stdout, "of the same base name.\n\n");

    fprintf(stdout, "\t-%c, --%s=DIR   Directory to scan for archives (default: current directory)\n",
        TarzipArgv::Directory.val, TarzipArgv::Directory.name);
    fprintf(stdout, "\t-%c, --%s=DIR      Directory to write zip archives to (default: input directory)\n",
        TarzipArgv::Output.val, TarzipArgv::Output.name);
    fprintf(stdout, "\t-%c, --%s           Replace existing zip archives and staging directories\n",
        TarzipArgv::Force.val, TarzipArgv::Force.name);
    fprintf(stdout, "\t-%c, --%s=N          Convert up to N archives in parallel (default: $%s or 1)\n",
        TarzipArgv::Jobs.val, TarzipArgv::Jobs.name, TARZIP_JOBS_ENV_VAR);
    fprintf(stdout, "\t-%c, --%s       Stop starting new conversions after the first failure\n",
        TarzipArgv::FailFast.val, TarzipArgv::FailFast.name);
    fprintf(stdout, "\t-%c, --%s         List planned conversions without writing anything\n",
        TarzipArgv::DryRun.val, TarzipArgv::DryRun.name);
    fprintf(stdout, "\t-%c, --%s=FILE     Write a JSON report of every conversion to FILE\n",
        TarzipArgv::Report.val, TarzipArgv::Report.name);
    fprintf(stdout, "\t-%c, --%s           Only print failures\n",
        TarzipArgv::Quiet.val, TarzipArgv::Quiet.name);
    fprintf(stdout, "\t    --%s           Write a debug log to $%s (default: %s)\n",
        TarzipArgv::Debug.name, TARZIP_LOG_DIR_ENV_VAR, TARZIP_DEFAULT_LOG_DIR);
    fprintf(stdout, "\t-%c, --%s            Display this text and exit\n\n",
        TarzipArgv::Help.val, TarzipArgv::Help.name);

    fprintf(stdout, "Exit status is %d if every archive was converted, %d if any failed,\n",
        TARZIP_EXIT_SUCCESS, TARZIP_EXIT_FAILURE);
    fprintf(stdout, "and %d for usage errors.\n", TARZIP_EXIT_USAGE);
}

static void log_terminate()
{
    if (auto eptr = std::current_exception()) {
        try {
            std::rethrow_exception(eptr);
        } catch(const std::exception& e) {
            getLogger().write("%s\n", e.what());
            fprintf(stderr, "tarzip: %s\n", e.what());
        }
    }

    std::abort();
}

int
main(int argc, char *argv[])
{
    std::set_terminate(log_terminate);

    // parse incoming argv
    auto options = CommandLineOptions{};
    try {
        options = parseCommandLine(argc, argv, getenv(TARZIP_JOBS_ENV_VAR));
    } catch (UsageError const& ex) {
        fprintf(stderr, "tarzip: %s\n", ex.what());
        usage(argv[0]);
        return TARZIP_EXIT_USAGE;
    }

    if (options.help) {
        usage(argv[0]);
        return TARZIP_EXIT_SUCCESS;
    }

    // Set up logging
    configureLogger(options.debug);
    getLogger().write("tarzip %s starting\n", TARZIP_RELEASE_VERSION);

    auto const codec = LibArchiveCodec{};
    return runCommandLine(std::move(options), codec, std::cout, std::cerr);
}

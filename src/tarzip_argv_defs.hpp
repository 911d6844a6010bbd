/******************************************************************************\
 * tarzip_argv_defs.hpp - A header file to define the strong argv interface
 *
 * Copyright 2024 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/
#pragma once

// Strong argv defs below
#include "useful/tarzip_argv.hpp"

struct TarzipArgv : public tarzip::Argv {
    using Option    = tarzip::Argv::Option;
    using Parameter = tarzip::Argv::Parameter;

    static constexpr Option Force    { "force",     'f' };
    static constexpr Option FailFast { "fail-fast", 'x' };
    static constexpr Option DryRun   { "dry-run",   'n' };
    static constexpr Option Quiet    { "quiet",     'q' };
    static constexpr Option Help     { "help",      'h' };
    static constexpr Option Debug    { "debug",      1  };

    static constexpr Parameter Directory { "directory", 'd' };
    static constexpr Parameter Output    { "output",    'o' };
    static constexpr Parameter Jobs      { "jobs",      'j' };
    static constexpr Parameter Report    { "report",    'r' };

    static constexpr GNUOption long_options[] = {
        Force,
        FailFast,
        DryRun,
        Quiet,
        Help,
        Debug,
        Directory,
        Output,
        Jobs,
        Report,
        long_options_done
    };
};

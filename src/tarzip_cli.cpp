/******************************************************************************\
 * tarzip_cli.cpp - Command line handling for the tarzip driver
 *
 * Copyright 2024 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "tarzip_defs.h"

#include <optional>
#include <tuple>
#include <unordered_map>

#include "tarzip_argv_defs.hpp"
#include "useful/tarzip_log.h"
#include "useful/tarzip_wrappers.hpp"

#include "convert/Report.hpp"

#include "tarzip_cli.hpp"

namespace tarzip {

unsigned
parseJobs(std::string const& jobsStr)
{
    size_t pos = 0;
    auto jobs = 0;
    try {
        jobs = std::stoi(jobsStr, &pos);
    } catch (std::invalid_argument const&) {
        throw UsageError("job count is not a number: " + jobsStr);
    } catch (std::out_of_range const&) {
        throw UsageError("job count is out of range: " + jobsStr);
    }

    if ((pos != jobsStr.length()) || (jobs < 1)) {
        throw UsageError("job count must be a positive integer: " + jobsStr);
    }
    return static_cast<unsigned>(jobs);
}

CommandLineOptions
parseCommandLine(int argc, char* const* argv, char const* jobsEnv)
{
    auto options = CommandLineOptions{};

    if (jobsEnv != nullptr) {
        try {
            options.config.jobs = parseJobs(jobsEnv);
        } catch (UsageError const& ex) {
            throw UsageError(std::string{TARZIP_JOBS_ENV_VAR} + ": " + ex.what());
        }
    }

    auto incomingArgv = IncomingArgv<TarzipArgv>{argc, argv};
    int c; std::string optarg;
    while (true) {
        std::tie(c, optarg) = incomingArgv.get_next();
        if (c < 0) {
            break;
        }

        switch (c) {

        case TarzipArgv::Directory.val:
            options.config.inputDir = optarg;
            break;

        case TarzipArgv::Output.val:
            options.config.outputDir = optarg;
            break;

        case TarzipArgv::Force.val:
            options.config.overwrite = OverwritePolicy::Overwrite;
            break;

        case TarzipArgv::Jobs.val:
            options.config.jobs = parseJobs(optarg);
            break;

        case TarzipArgv::FailFast.val:
            options.config.failFast = true;
            break;

        case TarzipArgv::DryRun.val:
            options.dryRun = true;
            break;

        case TarzipArgv::Report.val:
            options.reportPath = optarg;
            break;

        case TarzipArgv::Quiet.val:
            options.quiet = true;
            break;

        case TarzipArgv::Debug.val:
            options.debug = true;
            break;

        case TarzipArgv::Help.val:
            options.help = true;
            return options;

        case ':':
            throw UsageError("option is missing its value");

        case '?':
        default:
            throw UsageError("unrecognized option");

        }
    }

    if (incomingArgv.get_rest_argc() > 0) {
        throw UsageError(std::string{"unexpected argument "} + incomingArgv.get_rest()[0]);
    }

    return options;
}

void
printPlan(std::ostream& out, ArchiveConverter const& converter)
{
    auto const overwrite = (converter.config().overwrite == OverwritePolicy::Overwrite);

    auto owners = std::unordered_map<std::string, std::string>{};
    for (auto&& input : converter.scan()) {
        auto const output = converter.outputPathFor(input);
        out << input.path << " -> " << output;

        auto const [owner, claimed] = owners.emplace(input.base, input.name);
        if (!claimed) {
            out << " (collision: base name used by " << owner->second << ")";
        } else if (isDirectory(output.c_str())) {
            out << " (collision: output is a directory)";
        } else if (pathExists(output.c_str())) {
            out << (overwrite ? " (overwrite)" : " (collision: output exists)");
        }
        out << std::endl;
    }
}

int
runConversions(ArchiveConverter const& converter, CommandLineOptions const& options,
    std::ostream& out, std::ostream& err)
{
    // report each archive as it finishes
    auto const onResult = [&](ConversionResult const& result) {
        if (result.status == ConversionStatus::Failed) {
            err << describeResult(result) << std::endl;
        } else if (!options.quiet) {
            out << describeResult(result) << std::endl;
        }
        for (auto&& warning : result.warnings) {
            err << result.input << ": " << warning << std::endl;
        }
    };

    auto summary = BatchSummary{};
    try {
        summary = converter.convertAll(onResult);
    } catch (std::exception const& ex) {
        // the input directory could not be read
        getLogger().write("%s\n", ex.what());
        err << "tarzip: " << ex.what() << std::endl;
        return TARZIP_EXIT_USAGE;
    }

    if (!options.quiet || !summary.ok()) {
        printSummary(summary.ok() ? out : err, summary);
    }

    getLogger().write("%zu converted, %zu failed, %zu skipped\n",
        summary.succeeded(), summary.failed(), summary.skipped());

    if (!options.reportPath.empty()) {
        try {
            writeJsonReport(options.reportPath, summary);
        } catch (std::exception const& ex) {
            getLogger().write("%s\n", ex.what());
            err << "tarzip: failed to write report: " << ex.what() << std::endl;
            return TARZIP_EXIT_FAILURE;
        }
    }

    return summary.ok() ? TARZIP_EXIT_SUCCESS : TARZIP_EXIT_FAILURE;
}

int
runCommandLine(CommandLineOptions options, ArchiveCodec const& codec,
    std::ostream& out, std::ostream& err)
{
    auto converter = std::optional<ArchiveConverter>{};
    try {
        if (options.config.inputDir.empty()) {
            options.config.inputDir = cstr::getcwd();
        }
        converter.emplace(options.config, codec);

        if (options.dryRun) {
            printPlan(out, *converter);
            return TARZIP_EXIT_SUCCESS;
        }
    } catch (std::exception const& ex) {
        getLogger().write("%s\n", ex.what());
        err << "tarzip: " << ex.what() << std::endl;
        return TARZIP_EXIT_USAGE;
    }

    return runConversions(*converter, options, out, err);
}

} /* namespace tarzip */

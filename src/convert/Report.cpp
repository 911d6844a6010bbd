/******************************************************************************\
 * Report.cpp - Human and machine readable descriptions of conversion results
 *
 * Copyright 2024 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "tarzip_defs.h"

#include <stdio.h>
#include <string.h>

#include <cerrno>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "Report.hpp"

namespace tarzip {

char const*
statusName(ConversionStatus status)
{
    switch (status) {
        case ConversionStatus::Succeeded: return "succeeded";
        case ConversionStatus::Failed:    return "failed";
        case ConversionStatus::Skipped:   return "skipped";
        default: return "(unknown)";
    }
}

std::string
describeResult(ConversionResult const& result)
{
    auto line = std::stringstream{};
    switch (result.status) {
        case ConversionStatus::Succeeded:
            line << result.input << " -> " << result.output;
            break;
        case ConversionStatus::Failed:
            line << result.input << ": " << errorKindName(*result.errorKind)
                 << ": " << result.message;
            break;
        case ConversionStatus::Skipped:
            line << result.input << ": skipped";
            break;
    }
    return line.str();
}

void
printSummary(std::ostream& out, BatchSummary const& summary)
{
    for (auto&& result : summary.results) {
        if (result.status == ConversionStatus::Skipped) {
            out << describeResult(result) << std::endl;
        }
    }

    out << summary.succeeded() << " converted, " << summary.failed() << " failed";
    if (auto const skipped = summary.skipped()) {
        out << ", " << skipped << " skipped";
    }
    out << std::endl;
}

std::string
jsonQuote(std::string const& value)
{
    auto quoted = std::stringstream{};
    quoted << '"';
    for (auto&& c : value) {
        switch (c) {
            case '"':  quoted << "\\\""; break;
            case '\\': quoted << "\\\\"; break;
            case '\b': quoted << "\\b"; break;
            case '\f': quoted << "\\f"; break;
            case '\n': quoted << "\\n"; break;
            case '\r': quoted << "\\r"; break;
            case '\t': quoted << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    quoted << buf;
                } else {
                    // bytes above 0x7f pass through, paths are not re-encoded
                    quoted << c;
                }
        }
    }
    quoted << '"';
    return quoted.str();
}

std::string
summaryToJson(BatchSummary const& summary)
{
    auto json = std::stringstream{};
    json << "{\n"
         << "    \"succeeded\": " << summary.succeeded() << ",\n"
         << "    \"failed\": "    << summary.failed()    << ",\n"
         << "    \"skipped\": "   << summary.skipped()   << ",\n"
         << "    \"conversions\": [";

    auto firstResult = true;
    for (auto&& result : summary.results) {
        json << (firstResult ? "\n" : ",\n");
        firstResult = false;

        json << "        {\n"
             << "            \"input\": "  << jsonQuote(result.input) << ",\n"
             << "            \"output\": " << jsonQuote(result.output) << ",\n"
             << "            \"status\": " << jsonQuote(statusName(result.status)) << ",\n";
        if (result.errorKind) {
            json << "            \"error\": " << jsonQuote(errorKindName(*result.errorKind)) << ",\n";
        }
        if (!result.message.empty()) {
            json << "            \"message\": " << jsonQuote(result.message) << ",\n";
        }

        json << "            \"warnings\": [";
        auto firstWarning = true;
        for (auto&& warning : result.warnings) {
            json << (firstWarning ? "\n" : ",\n") << "                " << jsonQuote(warning);
            firstWarning = false;
        }
        json << (firstWarning ? "]\n" : "\n            ]\n");

        json << "        }";
    }
    json << (firstResult ? "]\n" : "\n    ]\n");
    json << "}\n";

    return json.str();
}

void
writeJsonReport(std::string const& path, BatchSummary const& summary)
{
    auto reportFile = std::ofstream{path, std::ios::trunc};
    if (!reportFile) {
        throw std::runtime_error("failed to open " + path + ": " + strerror(errno));
    }

    reportFile << summaryToJson(summary);
    reportFile.close();
    if (!reportFile) {
        throw std::runtime_error("failed to write " + path);
    }
}

} /* namespace tarzip */

/******************************************************************************\
 * Report.hpp - Human and machine readable descriptions of conversion results
 *
 * Copyright 2024 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <ostream>
#include <string>

#include "Converter.hpp"

namespace tarzip {

char const* statusName(ConversionStatus status);

// one line per result, failures name the stage that failed
std::string describeResult(ConversionResult const& result);

// lines for archives that were never attempted, then a closing count line.
// finished conversions are reported as they complete
void printSummary(std::ostream& out, BatchSummary const& summary);

// JSON string literal for value, quotes included
std::string jsonQuote(std::string const& value);

// counts are numbers and lists are arrays even when empty. error and message
// are only present when set
std::string summaryToJson(BatchSummary const& summary);

// write summaryToJson to path. throws std::runtime_error
void writeJsonReport(std::string const& path, BatchSummary const& summary);

} /* namespace tarzip */

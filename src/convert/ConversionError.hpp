/******************************************************************************\
 * ConversionError.hpp - Error kinds reported for a single archive conversion
 *
 * Copyright 2024 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <stdexcept>
#include <string>

namespace tarzip {

// Stage of the conversion pipeline that failed
enum class ErrorKind {
    StagingCreate,
    Extraction,
    Compression,
    Cleanup,
    Collision,
};

static inline char const* errorKindName(ErrorKind kind)
{
    switch (kind) {
        case ErrorKind::StagingCreate: return "StagingCreateError";
        case ErrorKind::Extraction:    return "ExtractionError";
        case ErrorKind::Compression:   return "CompressionError";
        case ErrorKind::Cleanup:       return "CleanupError";
        case ErrorKind::Collision:     return "CollisionError";
        default: return "(unknown)";
    }
}

class ConversionError : public std::runtime_error
{
private: // variables
    ErrorKind m_kind;

public: // interface
    ConversionError(ErrorKind kind, std::string const& what)
        : std::runtime_error{what}
        , m_kind{kind}
    {}

    ErrorKind kind() const { return m_kind; }
};

} /* namespace tarzip */

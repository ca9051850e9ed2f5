// SPDX-License-Identifier: MIT

// lib/stream/error.hpp
#pragma once

#include <string>
#include <string_view>

namespace hcat_pipe {

/// Error codes for schema resolution, coercion and the import harness.
enum class ErrorCode {
    // Schema
    SchemaLookupFailed,     ///< Source field has no entry in the target schema
    DuplicateField,         ///< Two schema fields collide after lower-casing
    InvalidSchema,          ///< Column type string not recognized

    // Coercion
    UnsupportedSourceType,  ///< Source value holds no recognized kind
    UnsupportedMapping,     ///< Source kind cannot be converted to the target type

    // Validation
    NullPartitionKey,       ///< Partition column converted to null

    // Config
    InvalidConfig,          ///< Job property holds an unparsable value

    // Upstream
    LargeObjectUnavailable, ///< Large-object content could not be read
    IoError,                ///< Upstream failure surfaced by the import harness

    // State
    InvalidState,           ///< Method called in wrong mapper state
};

/// Error payload returned through std::expected and delivered to OnError.
struct Error {
    ErrorCode code;        ///< Classified error code
    std::string message;   ///< Human-readable description
};

/// Return a short category string for an error code (e.g. "schema", "coercion").
constexpr std::string_view error_category(ErrorCode code) {
    switch (code) {
        case ErrorCode::SchemaLookupFailed:
        case ErrorCode::DuplicateField:
        case ErrorCode::InvalidSchema:
            return "schema";
        case ErrorCode::UnsupportedSourceType:
        case ErrorCode::UnsupportedMapping:
            return "coercion";
        case ErrorCode::NullPartitionKey:
            return "validation";
        case ErrorCode::InvalidConfig:
            return "config";
        case ErrorCode::LargeObjectUnavailable:
        case ErrorCode::IoError:
            return "io";
        case ErrorCode::InvalidState:
            return "state";
    }
    return "unknown";
}

}  // namespace hcat_pipe

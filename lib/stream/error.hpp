// SPDX-License-Identifier: MIT

// lib/stream/error.hpp
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace feedpipe {

/// Error codes for stream sessions and feed operations.
enum class ErrorCode {
    // Connection
    ConnectionLost,        ///< Source connection dropped mid-stream

    // Query
    QueryRejected,         ///< Source refused the query (bad filter, auth, limits)

    // Stream
    StreamFailed,          ///< Any other terminal failure reported by the stream
};

/// Error payload delivered to OnError callbacks.
struct Error {
    ErrorCode code;                ///< Classified error code
    std::string message;           ///< Human-readable description
    uint64_t generation = 0;       ///< Session generation the error belongs to, 0 if none
};

/// Return a short category string for an error code (e.g. "connection", "query").
constexpr std::string_view error_category(ErrorCode code) {
    switch (code) {
        case ErrorCode::ConnectionLost:
            return "connection";
        case ErrorCode::QueryRejected:
            return "query";
        case ErrorCode::StreamFailed:
            return "stream";
    }
    return "unknown";
}

/// Return the enumerator name of an error code.
constexpr std::string_view error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::ConnectionLost: return "ConnectionLost";
        case ErrorCode::QueryRejected:  return "QueryRejected";
        case ErrorCode::StreamFailed:   return "StreamFailed";
    }
    return "Unknown";
}

}  // namespace feedpipe

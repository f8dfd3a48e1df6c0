#pragma once

#include <string>

namespace filelink::core {

/// @brief Canonical error codes used across modules and mapped to HTTP responses.
enum class ErrorCode {
    kOk = 0,
    kInvalidArgument,
    kUnauthorized,
    kForbidden,
    kNotFound,
    kRangeNotSatisfiable,
    kBusy,
    kUnavailable,
    kTimeout,
    kIoError,
    kDbError,
    kCancelled,
    kInternal,
};

/// @brief Error payload describing a failure with a code and human-readable message.
struct Error {
    ErrorCode code{ErrorCode::kOk};
    std::string message;
};

/// @brief Stable upper-case name for an error code, used in logs and JSON envelopes.
const char* ErrorCodeName(ErrorCode code);

}  // namespace filelink::core

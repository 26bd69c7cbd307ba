#pragma once

#include <string>

namespace pathgate::core {

/// @brief Canonical error codes used across modules and mapped to HTTP responses.
enum class ErrorCode {
    kOk = 0,
    kInvalidArgument,
    kNotFound,
    kAlreadyExists,
    kIoError,
    kPathTraversal,
    kPrefixViolation,
    kInternal,
};

/// @brief Error payload describing a failure with a code and human-readable message.
struct Error {
    ErrorCode code{ErrorCode::kOk};
    std::string message;
};

/// @brief Stable upper-case name for an error code, used in error envelopes and logs.
const char* ErrorCodeName(ErrorCode code);

/// @brief True for the path-policy failures raised by the sandbox validator.
inline bool IsPathViolation(ErrorCode code) {
    return code == ErrorCode::kPathTraversal || code == ErrorCode::kPrefixViolation;
}

}  // namespace pathgate::core

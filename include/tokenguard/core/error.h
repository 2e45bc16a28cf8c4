#pragma once

#include <string>

namespace tokenguard::core {

/// @brief Canonical error codes used across modules and mapped to HTTP responses.
enum class ErrorCode {
    kOk = 0,
    kInvalidArgument,
    kNotFound,
    kMethodNotAllowed,
    kIoError,
    kCancelled,
    kUnavailable,
    kUnauthorized,
    kForbidden,
    kInternal,
};

/// @brief Machine-readable failure kind for token verification.
///
/// Verification failures are reported to callers as either kUnauthorized or
/// kForbidden; the detail keeps the underlying cause distinguishable.
enum class ErrorDetail {
    kNone = 0,
    kMalformedToken,
    kUnsupportedAlgorithm,
    kUnknownKeyId,
    kKeySetUnavailable,
    kInvalidSignature,
    kIssuerMismatch,
    kTokenUseMismatch,
    kExpired,
    kClientIdMismatch,
    kInvalidTokenUse,
    kMissingRole,
};

/// @brief Error payload describing a failure with a code and human-readable message.
struct Error {
    ErrorCode code{ErrorCode::kOk};
    std::string message;
    ErrorDetail detail{ErrorDetail::kNone};
};

/// @brief Stable lowercase name for an error code (used in logs and error envelopes).
const char* ErrorCodeName(ErrorCode code);
const char* ErrorDetailName(ErrorDetail detail);

}  // namespace tokenguard::core

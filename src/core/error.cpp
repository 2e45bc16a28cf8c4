#include "tokenguard/core/error.h"

namespace tokenguard::core {

const char* ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return "ok";
        case ErrorCode::kInvalidArgument:
            return "invalid_argument";
        case ErrorCode::kNotFound:
            return "not_found";
        case ErrorCode::kMethodNotAllowed:
            return "method_not_allowed";
        case ErrorCode::kIoError:
            return "io_error";
        case ErrorCode::kCancelled:
            return "cancelled";
        case ErrorCode::kUnavailable:
            return "unavailable";
        case ErrorCode::kUnauthorized:
            return "unauthorized";
        case ErrorCode::kForbidden:
            return "forbidden";
        case ErrorCode::kInternal:
            return "internal";
    }
    return "unknown";
}

const char* ErrorDetailName(ErrorDetail detail) {
    switch (detail) {
        case ErrorDetail::kNone:
            return "none";
        case ErrorDetail::kMalformedToken:
            return "malformed_token";
        case ErrorDetail::kUnsupportedAlgorithm:
            return "unsupported_algorithm";
        case ErrorDetail::kUnknownKeyId:
            return "unknown_key_id";
        case ErrorDetail::kKeySetUnavailable:
            return "key_set_unavailable";
        case ErrorDetail::kInvalidSignature:
            return "invalid_signature";
        case ErrorDetail::kIssuerMismatch:
            return "issuer_mismatch";
        case ErrorDetail::kTokenUseMismatch:
            return "token_use_mismatch";
        case ErrorDetail::kExpired:
            return "expired";
        case ErrorDetail::kClientIdMismatch:
            return "client_id_mismatch";
        case ErrorDetail::kInvalidTokenUse:
            return "invalid_token_use";
        case ErrorDetail::kMissingRole:
            return "missing_role";
    }
    return "unknown";
}

}  // namespace tokenguard::core

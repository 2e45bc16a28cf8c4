#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <Poco/JSON/Object.h>

#include "tokenguard/core/result.h"

namespace tokenguard::auth {

inline constexpr const char* kTokenUseAccess = "access";
inline constexpr const char* kTokenUseId = "id";

/// @brief The three base64url segments of a compact JWT, undecoded.
struct TokenSegments {
    std::string header;
    std::string claims;
    std::string signature;

    /// @brief Bytes covered by the signature: the first two segments joined by '.'.
    std::string SigningInput() const { return header + "." + claims; }
};

struct TokenHeader {
    std::string algorithm;
    std::string type;
    std::string key_id;
};

/// @brief Fields only an access token carries.
struct AccessTokenClaims {
    std::string client_id;
};

/// @brief Fields only an identity token carries.
struct IdTokenClaims {
    std::string audience;
    std::optional<std::string> email;
};

/// @brief Decoded claims; the variant is chosen from token_use at decode time.
struct TokenClaims {
    std::string issuer;
    std::string token_use;
    std::int64_t expiry{0};
    std::vector<std::string> roles;
    /// monostate when token_use is neither "access" nor "id".
    std::variant<std::monostate, AccessTokenClaims, IdTokenClaims> subject;
};

/// @brief Splits a token into exactly three non-empty segments.
core::Result<TokenSegments> SplitToken(const std::string& token);
core::Result<TokenHeader> DecodeHeader(const std::string& header64);
core::Result<TokenClaims> DecodeClaims(const std::string& claims64);

/// @brief Unverified typed decode of a whole token's claims. Display only.
core::Result<TokenClaims> DecodeTokenClaims(const std::string& token);
/// @brief Unverified open decode of a whole token's claims. Display only.
///
/// A numeric "exp" is replaced by the corresponding UTC Poco::DateTime.
/// Nothing here checks the signature; never authorize from this result.
core::Result<Poco::JSON::Object::Ptr> DecodeClaimsAsMap(const std::string& token);

}  // namespace tokenguard::auth

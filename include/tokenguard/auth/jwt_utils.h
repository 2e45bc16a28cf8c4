#pragma once

#include <optional>
#include <string>
#include <vector>

#include "tokenguard/core/result.h"

namespace tokenguard::auth {

/// @brief Decodes unpadded base64url (RFC 4648 section 5); padding or stray characters fail.
core::Result<std::vector<unsigned char>> Base64UrlDecode(const std::string& input);
core::Result<std::string> Base64UrlDecodeToString(const std::string& input);
std::vector<std::string> Split(const std::string& input, char delimiter);
std::string Trim(const std::string& input);
/// @brief Extracts the token from an "Authorization: Bearer <token>" header value.
std::optional<std::string> ExtractBearerToken(const std::string& authorization);

}  // namespace tokenguard::auth

#pragma once

#include <string>

#include "tokenguard/auth/key_codec.h"
#include "tokenguard/core/result.h"

namespace tokenguard::auth {

/// @brief Checks an RS256 (RSASSA-PKCS1-v1_5 with SHA-256) signature over signing_input.
core::Result<void> VerifyRs256(const std::string& signing_input,
                               const std::string& signature64,
                               const RsaPublicKey& key);

}  // namespace tokenguard::auth

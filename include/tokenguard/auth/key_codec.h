#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <openssl/evp.h>

#include "tokenguard/core/result.h"

namespace tokenguard::auth {

/// @brief One entry of a JWKS document, as published.
struct JsonWebKey {
    std::string kid;
    std::string kty;
    std::string alg;
    std::string n;
    std::string e;
};

/// @brief Decoded RSA public key usable for RS256 verification.
struct RsaPublicKey {
    using KeyPtr = std::shared_ptr<EVP_PKEY>;

    /// Big-endian modulus bytes, as decoded from the JWK.
    std::vector<unsigned char> modulus;
    std::uint32_t exponent{0};
    KeyPtr pkey;
};

/// @brief Converts an RSA JWK into a public key; fails on bad encoding or oversized exponent.
core::Result<RsaPublicKey> DecodeRsaKey(const JsonWebKey& jwk);

/// @brief Interprets big-endian exponent bytes as an unsigned 32-bit value.
core::Result<std::uint32_t> DecodeRsaExponent(const std::vector<unsigned char>& bytes);

}  // namespace tokenguard::auth

#include "tokenguard/auth/key_codec.h"

#include <openssl/bn.h>
#include <openssl/rsa.h>

#include "tokenguard/auth/jwt_utils.h"

namespace tokenguard::auth {

namespace {

std::uint32_t ReadBigEndian32(const unsigned char* bytes) {
    return (static_cast<std::uint32_t>(bytes[0]) << 24) |
           (static_cast<std::uint32_t>(bytes[1]) << 16) |
           (static_cast<std::uint32_t>(bytes[2]) << 8) |
           static_cast<std::uint32_t>(bytes[3]);
}

core::Error DecodeError(const std::string& message) {
    return core::Error{core::ErrorCode::kInvalidArgument, message};
}

RsaPublicKey::KeyPtr MakeRsaKey(const std::vector<unsigned char>& n_bytes,
                                std::uint32_t exponent) {
    BIGNUM* n = BN_bin2bn(n_bytes.data(), static_cast<int>(n_bytes.size()), nullptr);
    BIGNUM* e = BN_new();
    if (!n || !e || BN_set_word(e, exponent) != 1) {
        if (n) BN_free(n);
        if (e) BN_free(e);
        return {};
    }

    RSA* rsa = RSA_new();
    if (!rsa) {
        BN_free(n);
        BN_free(e);
        return {};
    }
    if (RSA_set0_key(rsa, n, e, nullptr) != 1) {
        RSA_free(rsa);
        BN_free(n);
        BN_free(e);
        return {};
    }

    EVP_PKEY* pkey = EVP_PKEY_new();
    if (!pkey) {
        RSA_free(rsa);
        return {};
    }
    if (EVP_PKEY_assign_RSA(pkey, rsa) != 1) {
        EVP_PKEY_free(pkey);
        RSA_free(rsa);
        return {};
    }

    return RsaPublicKey::KeyPtr(pkey, EVP_PKEY_free);
}

}  // namespace

core::Result<std::uint32_t> DecodeRsaExponent(const std::vector<unsigned char>& bytes) {
    if (bytes.size() == 3) {
        const unsigned char widened[4] = {0, bytes[0], bytes[1], bytes[2]};
        return ReadBigEndian32(widened);
    }
    if (bytes.size() == 4) {
        return ReadBigEndian32(bytes.data());
    }

    // Any other width: arbitrary precision, but it still has to fit in 32 bits.
    BIGNUM* e = BN_bin2bn(bytes.data(), static_cast<int>(bytes.size()), nullptr);
    if (!e) {
        return core::Error{core::ErrorCode::kInternal, "bignum allocation failed"};
    }
    if (BN_num_bits(e) > 32) {
        BN_free(e);
        return DecodeError("JWK exponent too large");
    }
    const auto value = static_cast<std::uint32_t>(BN_get_word(e));
    BN_free(e);
    return value;
}

core::Result<RsaPublicKey> DecodeRsaKey(const JsonWebKey& jwk) {
    auto n_bytes = Base64UrlDecode(jwk.n);
    if (!n_bytes.ok()) {
        return DecodeError("invalid JWK modulus encoding");
    }
    auto e_bytes = Base64UrlDecode(jwk.e);
    if (!e_bytes.ok()) {
        return DecodeError("invalid JWK exponent encoding");
    }
    if (n_bytes.value().empty() || e_bytes.value().empty()) {
        return DecodeError("empty JWK modulus or exponent");
    }

    auto exponent = DecodeRsaExponent(e_bytes.value());
    if (!exponent.ok()) {
        return exponent.error();
    }

    RsaPublicKey key;
    key.pkey = MakeRsaKey(n_bytes.value(), exponent.value());
    if (!key.pkey) {
        return core::Error{core::ErrorCode::kInternal, "failed to build RSA public key"};
    }
    key.modulus = std::move(n_bytes.value());
    key.exponent = exponent.value();
    return key;
}

}  // namespace tokenguard::auth

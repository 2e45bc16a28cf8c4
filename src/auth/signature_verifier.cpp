#include "tokenguard/auth/signature_verifier.h"

#include <openssl/evp.h>

#include "tokenguard/auth/jwt_utils.h"

namespace tokenguard::auth {

namespace {

core::Error SignatureError(const std::string& message) {
    return core::Error{core::ErrorCode::kUnauthorized, message,
                       core::ErrorDetail::kInvalidSignature};
}

}  // namespace

core::Result<void> VerifyRs256(const std::string& signing_input,
                               const std::string& signature64,
                               const RsaPublicKey& key) {
    if (!key.pkey) {
        return SignatureError("missing JWK key");
    }
    auto signature = Base64UrlDecode(signature64);
    if (!signature.ok() || signature.value().empty()) {
        return SignatureError("invalid JWT signature format");
    }

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        return SignatureError("signature init failed");
    }

    // EVP_DigestVerifyInit defaults RSA keys to PKCS#1 v1.5 padding.
    int ok = EVP_DigestVerifyInit(ctx, nullptr, EVP_sha256(), nullptr, key.pkey.get());
    if (ok != 1) {
        EVP_MD_CTX_free(ctx);
        return SignatureError("signature init failed");
    }
    ok = EVP_DigestVerify(ctx,
                          signature.value().data(),
                          signature.value().size(),
                          reinterpret_cast<const unsigned char*>(signing_input.data()),
                          signing_input.size());
    EVP_MD_CTX_free(ctx);
    if (ok != 1) {
        return SignatureError("invalid JWT signature");
    }
    return core::Ok();
}

}  // namespace tokenguard::auth

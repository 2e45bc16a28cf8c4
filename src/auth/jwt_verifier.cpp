#include "tokenguard/auth/jwt_verifier.h"

#include <utility>

#include "tokenguard/auth/signature_verifier.h"
#include "tokenguard/core/logger.h"
#include "tokenguard/core/time.h"
#include "tokenguard/observability/metrics.h"

namespace tokenguard::auth {

namespace {

constexpr const char* kRs256 = "RS256";

core::Error Unauthorized(const std::string& message, core::ErrorDetail detail) {
    return core::Error{core::ErrorCode::kUnauthorized, message, detail};
}

core::Result<RsaPublicKey> ResolveKey(const core::Context& ctx, JwksCache& cache,
                                      const std::string& kid) {
    if (auto key = cache.Lookup(kid)) {
        return *key;
    }
    // Unknown kid: the signer may have rotated keys, so re-sync once.
    core::LogDebug("kid " + kid + " not cached, refreshing JWKS");
    auto fetch = cache.Fetch(ctx);
    if (!fetch.ok()) {
        return Unauthorized(fetch.error().message, core::ErrorDetail::kKeySetUnavailable);
    }
    if (auto key = cache.Lookup(kid)) {
        return *key;
    }
    return Unauthorized("JWKS kid is not found", core::ErrorDetail::kUnknownKeyId);
}

}  // namespace

core::Result<TokenClaims> AssertJwt(const core::Context& ctx, const std::string& token,
                                    JwksCache& cache, const ClaimsPolicy& policy) {
    auto segments = SplitToken(token);
    if (!segments.ok()) {
        return segments.error();
    }
    auto header = DecodeHeader(segments.value().header);
    if (!header.ok()) {
        return header.error();
    }
    if (header.value().algorithm != kRs256) {
        return Unauthorized("unsupported JWT signature algorithm",
                            core::ErrorDetail::kUnsupportedAlgorithm);
    }

    auto key = ResolveKey(ctx, cache, header.value().key_id);
    if (!key.ok()) {
        return key.error();
    }

    auto claims = DecodeClaims(segments.value().claims);
    if (!claims.ok()) {
        return claims.error();
    }
    auto signature =
        VerifyRs256(segments.value().SigningInput(), segments.value().signature, key.value());
    if (!signature.ok()) {
        return signature.error();
    }
    auto check = CheckClaims(claims.value(), policy, core::NowEpochSeconds());
    if (!check.ok()) {
        return check.error();
    }
    return claims;
}

core::Result<TokenClaims> AssertJwt(const core::Context& ctx, const std::string& token,
                                    JwksCache& cache, const std::string& issuer,
                                    const std::string& token_use,
                                    const std::set<std::string>& client_ids,
                                    const std::vector<RoleGroup>& role_groups) {
    return AssertJwt(ctx, token, cache, ClaimsPolicy{issuer, token_use, client_ids, role_groups});
}

ClaimsPolicy PolicyFromConfig(const core::PolicyConfig& config) {
    ClaimsPolicy policy;
    policy.issuer = config.issuer;
    policy.token_use = config.token_use;
    policy.client_ids.insert(config.client_ids.begin(), config.client_ids.end());
    policy.required_role_groups = config.role_groups;
    return policy;
}

JwtVerifier::JwtVerifier(std::shared_ptr<JwksCache> cache, ClaimsPolicy policy)
    : cache_(std::move(cache)), policy_(std::move(policy)) {}

core::Result<TokenClaims> JwtVerifier::Verify(const core::Context& ctx,
                                              const std::string& token) const {
    return Verify(ctx, token, policy_.required_role_groups);
}

core::Result<TokenClaims> JwtVerifier::Verify(const core::Context& ctx, const std::string& token,
                                              const std::vector<RoleGroup>& role_groups) const {
    ClaimsPolicy policy = policy_;
    policy.required_role_groups = role_groups;
    auto result = AssertJwt(ctx, token, *cache_, policy);
    if (result.ok()) {
        observability::RecordVerification(core::ErrorCode::kOk);
    } else {
        observability::RecordVerification(result.error().code);
        core::LogDebug(std::string("token rejected (") +
                       core::ErrorDetailName(result.error().detail) + "): " +
                       result.error().message);
    }
    return result;
}

}  // namespace tokenguard::auth

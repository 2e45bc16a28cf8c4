#pragma once

#include <memory>
#include <set>
#include <string>
#include <vector>

#include "tokenguard/auth/claims_policy.h"
#include "tokenguard/auth/jwks_cache.h"
#include "tokenguard/auth/jwt_parser.h"
#include "tokenguard/core/config.h"
#include "tokenguard/core/context.h"
#include "tokenguard/core/result.h"

namespace tokenguard::auth {

/// @brief Verifies an RS256 token end to end and returns its claims.
///
/// Parses the token, requires alg RS256, resolves the key by kid (on a miss
/// the cache is fetched once and looked up once more), verifies the
/// signature and evaluates the policy. Failures are kUnauthorized, except
/// unmet role groups which are kForbidden. A failed key-set fetch is
/// reported as kUnauthorized with detail kKeySetUnavailable.
core::Result<TokenClaims> AssertJwt(const core::Context& ctx, const std::string& token,
                                    JwksCache& cache, const ClaimsPolicy& policy);

core::Result<TokenClaims> AssertJwt(const core::Context& ctx, const std::string& token,
                                    JwksCache& cache, const std::string& issuer,
                                    const std::string& token_use,
                                    const std::set<std::string>& client_ids,
                                    const std::vector<RoleGroup>& role_groups);

/// @brief Builds the policy described by the configuration.
ClaimsPolicy PolicyFromConfig(const core::PolicyConfig& config);

/// @brief AssertJwt bound to one key cache and one configured policy.
class JwtVerifier {
public:
    JwtVerifier(std::shared_ptr<JwksCache> cache, ClaimsPolicy policy);

    core::Result<TokenClaims> Verify(const core::Context& ctx, const std::string& token) const;
    /// @brief Verify with the configured policy but different role requirements.
    core::Result<TokenClaims> Verify(const core::Context& ctx, const std::string& token,
                                     const std::vector<RoleGroup>& role_groups) const;

    const ClaimsPolicy& policy() const { return policy_; }
    JwksCache& cache() const { return *cache_; }

private:
    std::shared_ptr<JwksCache> cache_;
    ClaimsPolicy policy_;
};

}  // namespace tokenguard::auth

#include "tokenguard/auth/claims_policy.h"

#include <algorithm>

#include "tokenguard/auth/jwt_utils.h"

namespace tokenguard::auth {

namespace {

core::Error Unauthorized(const std::string& message, core::ErrorDetail detail) {
    return core::Error{core::ErrorCode::kUnauthorized, message, detail};
}

std::string JoinRoles(const RoleGroup& group) {
    std::string joined;
    for (const auto& role : group) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += role;
    }
    return joined;
}

bool HoldsAnyRole(const std::vector<std::string>& roles, const RoleGroup& group) {
    return std::any_of(roles.begin(), roles.end(), [&group](const std::string& role) {
        return std::find(group.begin(), group.end(), role) != group.end();
    });
}

}  // namespace

core::Result<void> CheckClaims(const TokenClaims& claims, const ClaimsPolicy& policy,
                               std::int64_t now) {
    if (claims.issuer != policy.issuer) {
        return Unauthorized("invalid JWT issuer", core::ErrorDetail::kIssuerMismatch);
    }
    if (claims.token_use != policy.token_use) {
        return Unauthorized("invalid JWT use", core::ErrorDetail::kTokenUseMismatch);
    }
    if (claims.expiry < now) {
        return Unauthorized("expired JWT", core::ErrorDetail::kExpired);
    }

    const std::string* subject_id = nullptr;
    if (policy.token_use == kTokenUseAccess) {
        if (const auto* access = std::get_if<AccessTokenClaims>(&claims.subject)) {
            subject_id = &access->client_id;
        }
    } else if (policy.token_use == kTokenUseId) {
        if (const auto* id = std::get_if<IdTokenClaims>(&claims.subject)) {
            subject_id = &id->audience;
        }
    } else {
        return Unauthorized("invalid token use", core::ErrorDetail::kInvalidTokenUse);
    }
    if (!subject_id || policy.client_ids.count(*subject_id) == 0) {
        return Unauthorized("invalid client ID", core::ErrorDetail::kClientIdMismatch);
    }

    for (const auto& group : policy.required_role_groups) {
        if (!HoldsAnyRole(claims.roles, group)) {
            return core::Error{core::ErrorCode::kForbidden,
                               "missing role: at least one of " + JoinRoles(group) +
                                   " is required",
                               core::ErrorDetail::kMissingRole};
        }
    }
    return core::Ok();
}

std::vector<RoleGroup> ParseRoleGroups(const std::string& text) {
    std::vector<RoleGroup> groups;
    for (const auto& part : Split(text, ',')) {
        RoleGroup group;
        for (const auto& role : Split(part, '|')) {
            auto trimmed = Trim(role);
            if (!trimmed.empty()) {
                group.push_back(std::move(trimmed));
            }
        }
        if (!group.empty()) {
            groups.push_back(std::move(group));
        }
    }
    return groups;
}

}  // namespace tokenguard::auth

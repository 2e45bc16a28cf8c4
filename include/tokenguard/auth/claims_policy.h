#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <vector>

#include "tokenguard/auth/jwt_parser.h"
#include "tokenguard/core/result.h"

namespace tokenguard::auth {

/// @brief Roles of which a token must hold at least one.
using RoleGroup = std::vector<std::string>;

/// @brief What a caller requires of a token's claims.
///
/// Every group in required_role_groups must be satisfied (AND), each by any
/// one of its members (OR). An empty list imposes no role constraint.
struct ClaimsPolicy {
    std::string issuer;
    std::string token_use;
    std::set<std::string> client_ids;
    std::vector<RoleGroup> required_role_groups;
};

/// @brief Evaluates claims against policy at time now (UTC seconds); first failure wins.
///
/// Checks issuer, token use, expiry, client id (access) or audience (id),
/// then role groups in order. Role failures are kForbidden, all others
/// kUnauthorized.
core::Result<void> CheckClaims(const TokenClaims& claims, const ClaimsPolicy& policy,
                               std::int64_t now);

/// @brief Parses "a|b,c" into role groups {a,b} AND {c}; blank members are dropped.
std::vector<RoleGroup> ParseRoleGroups(const std::string& text);

}  // namespace tokenguard::auth

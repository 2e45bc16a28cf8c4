#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "tokenguard/auth/claims_policy.h"

using namespace tokenguard::auth;
using tokenguard::core::ErrorCode;
using tokenguard::core::ErrorDetail;

namespace {

constexpr std::int64_t kNow = 1700000000;

ClaimsPolicy AccessPolicy() {
    return ClaimsPolicy{"https://issuer", kTokenUseAccess, {"app"}, {}};
}

TokenClaims AccessToken(std::vector<std::string> roles = {}) {
    TokenClaims claims;
    claims.issuer = "https://issuer";
    claims.token_use = kTokenUseAccess;
    claims.expiry = kNow + 60;
    claims.roles = std::move(roles);
    claims.subject = AccessTokenClaims{"app"};
    return claims;
}

TokenClaims IdToken(const std::string& audience) {
    TokenClaims claims;
    claims.issuer = "https://issuer";
    claims.token_use = kTokenUseId;
    claims.expiry = kNow + 60;
    claims.subject = IdTokenClaims{audience, std::string("a@example.com")};
    return claims;
}

}  // namespace

TEST(ClaimsPolicy, AcceptsMatchingAccessToken) {
    EXPECT_TRUE(CheckClaims(AccessToken(), AccessPolicy(), kNow).ok());
}

TEST(ClaimsPolicy, IssuerMismatch) {
    auto claims = AccessToken();
    claims.issuer = "https://other";
    auto result = CheckClaims(claims, AccessPolicy(), kNow);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::kUnauthorized);
    EXPECT_EQ(result.error().detail, ErrorDetail::kIssuerMismatch);
    EXPECT_EQ(result.error().message, "invalid JWT issuer");
}

TEST(ClaimsPolicy, TokenUseMismatch) {
    auto result = CheckClaims(IdToken("app"), AccessPolicy(), kNow);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().message, "invalid JWT use");
}

TEST(ClaimsPolicy, ExpiryBoundary) {
    auto claims = AccessToken();
    claims.expiry = kNow - 1;
    auto expired = CheckClaims(claims, AccessPolicy(), kNow);
    ASSERT_FALSE(expired.ok());
    EXPECT_EQ(expired.error().detail, ErrorDetail::kExpired);
    EXPECT_EQ(expired.error().message, "expired JWT");

    claims.expiry = kNow;
    EXPECT_TRUE(CheckClaims(claims, AccessPolicy(), kNow).ok());
}

TEST(ClaimsPolicy, ClientIdMustBeAllowed) {
    auto claims = AccessToken();
    claims.subject = AccessTokenClaims{"intruder"};
    auto result = CheckClaims(claims, AccessPolicy(), kNow);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().detail, ErrorDetail::kClientIdMismatch);
    EXPECT_EQ(result.error().message, "invalid client ID");
}

TEST(ClaimsPolicy, IdTokenChecksAudience) {
    ClaimsPolicy policy{"https://issuer", kTokenUseId, {"web", "mobile"}, {}};
    EXPECT_TRUE(CheckClaims(IdToken("mobile"), policy, kNow).ok());

    auto result = CheckClaims(IdToken("app"), policy, kNow);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().message, "invalid client ID");
}

TEST(ClaimsPolicy, UnknownTokenUseIsRejected) {
    ClaimsPolicy policy{"https://issuer", "refresh", {"app"}, {}};
    auto claims = AccessToken();
    claims.token_use = "refresh";
    claims.subject = std::monostate{};
    auto result = CheckClaims(claims, policy, kNow);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().detail, ErrorDetail::kInvalidTokenUse);
    EXPECT_EQ(result.error().message, "invalid token use");
}

TEST(ClaimsPolicy, FirstFailureWins) {
    // Wrong issuer, wrong client and expired at once: issuer is reported.
    auto claims = AccessToken();
    claims.issuer = "https://other";
    claims.expiry = kNow - 100;
    claims.subject = AccessTokenClaims{"intruder"};
    EXPECT_EQ(CheckClaims(claims, AccessPolicy(), kNow).error().detail,
              ErrorDetail::kIssuerMismatch);

    claims.issuer = "https://issuer";
    EXPECT_EQ(CheckClaims(claims, AccessPolicy(), kNow).error().detail, ErrorDetail::kExpired);

    // Role failures come after everything else.
    auto policy = AccessPolicy();
    policy.required_role_groups = {{"admin"}};
    claims.expiry = kNow + 10;
    EXPECT_EQ(CheckClaims(claims, policy, kNow).error().detail, ErrorDetail::kClientIdMismatch);
}

TEST(ClaimsPolicy, RoleGroupsAreAndOfOrs) {
    auto policy = AccessPolicy();
    policy.required_role_groups = {{"admin", "owner"}, {"billing"}};

    EXPECT_TRUE(CheckClaims(AccessToken({"owner", "billing"}), policy, kNow).ok());
    EXPECT_TRUE(CheckClaims(AccessToken({"billing", "admin", "extra"}), policy, kNow).ok());

    auto missing_billing = CheckClaims(AccessToken({"admin"}), policy, kNow);
    ASSERT_FALSE(missing_billing.ok());
    EXPECT_EQ(missing_billing.error().code, ErrorCode::kForbidden);
    EXPECT_EQ(missing_billing.error().detail, ErrorDetail::kMissingRole);
    EXPECT_EQ(missing_billing.error().message, "missing role: at least one of billing is required");

    auto missing_admin = CheckClaims(AccessToken({"billing"}), policy, kNow);
    ASSERT_FALSE(missing_admin.ok());
    EXPECT_EQ(missing_admin.error().message,
              "missing role: at least one of admin, owner is required");
}

TEST(ClaimsPolicy, EmptyGroupListAllowsAnyRoles) {
    EXPECT_TRUE(CheckClaims(AccessToken(), AccessPolicy(), kNow).ok());
    EXPECT_TRUE(CheckClaims(AccessToken({"anything"}), AccessPolicy(), kNow).ok());
}

TEST(ClaimsPolicy, Deterministic) {
    auto policy = AccessPolicy();
    policy.required_role_groups = {{"admin"}};
    const auto claims = AccessToken({"viewer"});
    const auto first = CheckClaims(claims, policy, kNow);
    for (int i = 0; i < 10; ++i) {
        const auto again = CheckClaims(claims, policy, kNow);
        EXPECT_EQ(again.ok(), first.ok());
        EXPECT_EQ(again.error().message, first.error().message);
    }
}

TEST(ParseRoleGroups, SplitsOnCommaThenPipe) {
    EXPECT_EQ(ParseRoleGroups("admin|owner,billing"),
              (std::vector<RoleGroup>{{"admin", "owner"}, {"billing"}}));
    EXPECT_EQ(ParseRoleGroups(" admin | owner , , billing|"),
              (std::vector<RoleGroup>{{"admin", "owner"}, {"billing"}}));
    EXPECT_TRUE(ParseRoleGroups("").empty());
    EXPECT_TRUE(ParseRoleGroups(",|,").empty());
}

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "support/jwt_fixtures.h"
#include "tokenguard/auth/jwks_cache.h"

using tokenguard::auth::JwksCache;
using tokenguard::core::Context;
using tokenguard::core::ErrorCode;
namespace fixtures = tokenguard::testing;

namespace {

std::shared_ptr<fixtures::FakeHttpClient> MakeClient() {
    return std::make_shared<fixtures::FakeHttpClient>();
}

}  // namespace

TEST(JwksCache, StartsEmpty) {
    JwksCache cache(MakeClient());
    EXPECT_EQ(cache.Size(), 0u);
    EXPECT_FALSE(cache.Lookup("k1").has_value());
}

TEST(JwksCache, FetchesWellKnownPath) {
    auto client = MakeClient();
    client->PushBody(fixtures::BuildJwks("k1", fixtures::PrimaryKey()));
    JwksCache cache(client);

    auto fetched = cache.Fetch(Context::Background());
    ASSERT_TRUE(fetched.ok()) << fetched.error().message;
    EXPECT_EQ(client->last_path(), "/.well-known/jwks.json");
    EXPECT_EQ(cache.Size(), 1u);

    auto key = cache.Lookup("k1");
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(key->exponent, 65537u);
    EXPECT_EQ(key->modulus, fixtures::ModulusBytes(fixtures::PrimaryKey()));
}

TEST(JwksCache, UsesConfiguredPath) {
    auto client = MakeClient();
    client->PushBody(fixtures::BuildJwks("k1", fixtures::PrimaryKey()));
    JwksCache cache(client, "/keys");
    ASSERT_TRUE(cache.Fetch(Context::Background()).ok());
    EXPECT_EQ(client->last_path(), "/keys");
}

TEST(JwksCache, NonOkStatusFails) {
    auto client = MakeClient();
    client->PushBody("{}", 500);
    JwksCache cache(client);
    auto fetched = cache.Fetch(Context::Background());
    ASSERT_FALSE(fetched.ok());
    EXPECT_EQ(fetched.error().code, ErrorCode::kUnavailable);
    EXPECT_EQ(fetched.error().message, "JWKS fetch: expected 200, got 500");
}

TEST(JwksCache, MalformedDocumentsFail) {
    for (const std::string body : {"not json", "{}", "{\"keys\":[]}", "[]"}) {
        auto client = MakeClient();
        client->PushBody(body);
        JwksCache cache(client);
        auto fetched = cache.Fetch(Context::Background());
        ASSERT_FALSE(fetched.ok()) << body;
        EXPECT_EQ(fetched.error().code, ErrorCode::kUnavailable) << body;
    }
}

TEST(JwksCache, DropsNonRsaAndUnusableKeys) {
    const auto body = fixtures::BuildJwksFromEntries({
        "{\"kty\":\"EC\",\"kid\":\"ec1\",\"crv\":\"P-256\",\"x\":\"AA\",\"y\":\"AA\"}",
        "{\"kty\":\"RSA\",\"kid\":\"bad\",\"n\":\"!!\",\"e\":\"AQAB\"}",
        "{\"kty\":\"RSA\",\"kid\":\"empty\",\"n\":\"\",\"e\":\"AQAB\"}",
        "{\"kty\":\"RSA\",\"n\":\"AQAB\",\"e\":\"AQAB\"}",
        "42",
        fixtures::BuildJwk("good", fixtures::PrimaryKey()),
    });
    auto client = MakeClient();
    client->PushBody(body);
    JwksCache cache(client);

    ASSERT_TRUE(cache.Fetch(Context::Background()).ok());
    EXPECT_EQ(cache.Size(), 1u);
    EXPECT_TRUE(cache.Lookup("good").has_value());
    EXPECT_FALSE(cache.Lookup("ec1").has_value());
    EXPECT_FALSE(cache.Lookup("bad").has_value());
}

TEST(JwksCache, OnlyUnusableKeysIsEmptySet) {
    auto client = MakeClient();
    client->PushBody(fixtures::BuildJwksFromEntries({"{\"kty\":\"oct\",\"kid\":\"s\",\"k\":\"AA\"}"}));
    JwksCache cache(client);
    auto fetched = cache.Fetch(Context::Background());
    ASSERT_FALSE(fetched.ok());
    EXPECT_EQ(fetched.error().message, "JWKS fetch: empty key set");
}

TEST(JwksCache, FailedFetchKeepsPreviousSet) {
    auto client = MakeClient();
    client->PushBody(fixtures::BuildJwks("k1", fixtures::PrimaryKey()));
    client->Push(tokenguard::core::Error{ErrorCode::kUnavailable, "connection refused"});
    JwksCache cache(client);

    ASSERT_TRUE(cache.Fetch(Context::Background()).ok());
    auto failed = cache.Fetch(Context::Background());
    ASSERT_FALSE(failed.ok());
    EXPECT_EQ(failed.error().message, "JWKS fetch: connection refused");
    EXPECT_TRUE(cache.Lookup("k1").has_value());

    client->PushBody("{\"keys\":[]}");
    EXPECT_FALSE(cache.Fetch(Context::Background()).ok());
    EXPECT_TRUE(cache.Lookup("k1").has_value());
}

TEST(JwksCache, SuccessfulFetchReplacesWholeSet) {
    auto client = MakeClient();
    client->PushBody(fixtures::BuildJwks("old", fixtures::PrimaryKey()));
    client->PushBody(fixtures::BuildJwks("new", fixtures::RotatedKey()));
    JwksCache cache(client);

    ASSERT_TRUE(cache.Fetch(Context::Background()).ok());
    ASSERT_TRUE(cache.Fetch(Context::Background()).ok());
    EXPECT_FALSE(cache.Lookup("old").has_value());
    EXPECT_TRUE(cache.Lookup("new").has_value());
}

TEST(JwksCache, CancelledFetchReportsCancellation) {
    auto client = MakeClient();
    client->PushBody(fixtures::BuildJwks("k1", fixtures::PrimaryKey()));
    JwksCache cache(client);
    auto ctx = Context::Background();
    ctx.Cancel();
    auto fetched = cache.Fetch(ctx);
    ASSERT_FALSE(fetched.ok());
    EXPECT_EQ(fetched.error().code, ErrorCode::kCancelled);
    EXPECT_EQ(cache.Size(), 0u);
}

TEST(JwksCache, LookupsProceedWhileFetchIsInFlight) {
    auto client = MakeClient();
    client->PushBody(fixtures::BuildJwks("k1", fixtures::PrimaryKey()));
    JwksCache cache(client);
    ASSERT_TRUE(cache.Fetch(Context::Background()).ok());

    bool found_during_fetch = false;
    client->SetHook([&cache, &found_during_fetch] {
        auto lookup = std::async(std::launch::async, [&cache] { return cache.Lookup("k1"); });
        ASSERT_EQ(lookup.wait_for(std::chrono::seconds(5)), std::future_status::ready);
        found_during_fetch = lookup.get().has_value();
    });
    ASSERT_TRUE(cache.Fetch(Context::Background()).ok());
    EXPECT_TRUE(found_during_fetch);
}

TEST(JwksCache, ReadersNeverObservePartialSet) {
    std::vector<std::string> small;
    std::vector<std::string> large;
    for (int i = 0; i < 2; ++i) {
        small.push_back(fixtures::BuildJwk("shared" + std::to_string(i), fixtures::PrimaryKey()));
    }
    large = small;
    for (int i = 0; i < 6; ++i) {
        large.push_back(fixtures::BuildJwk("extra" + std::to_string(i), fixtures::RotatedKey()));
    }

    auto client = MakeClient();
    JwksCache cache(client);
    ASSERT_TRUE(cache.LoadFromBody(fixtures::BuildJwksFromEntries(small)).ok());

    std::atomic<bool> stop{false};
    std::atomic<int> bad_sizes{0};
    std::atomic<int> missing_shared{0};
    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&] {
            while (!stop.load()) {
                const auto size = cache.Size();
                if (size != 2 && size != 8) {
                    ++bad_sizes;
                }
                if (!cache.Lookup("shared1").has_value()) {
                    ++missing_shared;
                }
            }
        });
    }

    const auto small_body = fixtures::BuildJwksFromEntries(small);
    const auto large_body = fixtures::BuildJwksFromEntries(large);
    for (int i = 0; i < 50; ++i) {
        client->PushBody(i % 2 == 0 ? large_body : small_body);
        EXPECT_TRUE(cache.Fetch(Context::Background()).ok());
    }
    stop = true;
    for (auto& reader : readers) {
        reader.join();
    }
    EXPECT_EQ(bad_sizes.load(), 0);
    EXPECT_EQ(missing_shared.load(), 0);
}

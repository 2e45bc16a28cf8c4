#include "tokenguard/auth/jwks_cache.h"

#include <mutex>
#include <utility>

#include <Poco/JSON/Array.h>
#include <Poco/JSON/Object.h>
#include <Poco/JSON/Parser.h>

#include "tokenguard/core/logger.h"
#include "tokenguard/observability/metrics.h"

namespace tokenguard::auth {

namespace {

core::Error FetchError(const std::string& message) {
    return core::Error{core::ErrorCode::kUnavailable, "JWKS fetch: " + message};
}

JsonWebKey ReadJwk(const Poco::JSON::Object::Ptr& obj) {
    JsonWebKey jwk;
    jwk.kid = obj->optValue<std::string>("kid", "");
    jwk.kty = obj->optValue<std::string>("kty", "");
    jwk.alg = obj->optValue<std::string>("alg", "");
    jwk.n = obj->optValue<std::string>("n", "");
    jwk.e = obj->optValue<std::string>("e", "");
    return jwk;
}

}  // namespace

JwksCache::JwksCache(std::shared_ptr<http::HttpClient> client, std::string path)
    : client_(std::move(client)),
      path_(std::move(path)),
      keys_(std::make_shared<const KeySet>()) {}

core::Result<void> JwksCache::Fetch(const core::Context& ctx) {
    auto response = client_->Get(ctx, path_);
    if (!response.ok()) {
        observability::RecordJwksFetch(false);
        core::LogError("JWKS fetch failed: " + response.error().message);
        if (response.error().code == core::ErrorCode::kCancelled) {
            return response.error();
        }
        return FetchError(response.error().message);
    }
    if (response.value().status != 200) {
        observability::RecordJwksFetch(false);
        const auto message =
            "expected 200, got " + std::to_string(response.value().status);
        core::LogError("JWKS fetch failed: " + message);
        return FetchError(message);
    }
    auto load = LoadFromBody(response.value().body);
    observability::RecordJwksFetch(load.ok());
    return load;
}

core::Result<void> JwksCache::LoadFromBody(const std::string& body) {
    auto parsed = ParseKeySet(body);
    if (!parsed.ok()) {
        core::LogError(parsed.error().message);
        return parsed.error();
    }
    const auto count = parsed.value()->size();
    {
        // Exclusive section covers the swap only.
        std::unique_lock<std::shared_mutex> lock(mutex_);
        keys_ = std::move(parsed.value());
    }
    observability::SetJwksKeyCount(count);
    core::LogInfo("JWKS loaded " + std::to_string(count) + " key(s)");
    return core::Ok();
}

std::optional<RsaPublicKey> JwksCache::Lookup(const std::string& kid) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = keys_->find(kid);
    if (it == keys_->end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t JwksCache::Size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return keys_->size();
}

core::Result<std::shared_ptr<const JwksCache::KeySet>> JwksCache::ParseKeySet(
    const std::string& body) {
    // Individual bad keys are logged and skipped; only an empty result fails.
    Poco::JSON::Array::Ptr keys;
    try {
        Poco::JSON::Parser parser;
        auto root = parser.parse(body).extract<Poco::JSON::Object::Ptr>();
        if (!root) {
            return FetchError("document is not an object");
        }
        keys = root->getArray("keys");
    } catch (const std::exception& ex) {
        return FetchError(std::string("invalid JSON: ") + ex.what());
    }
    if (!keys) {
        return FetchError("keys missing");
    }

    auto next = std::make_shared<KeySet>();
    for (size_t i = 0; i < keys->size(); ++i) {
        Poco::JSON::Object::Ptr obj;
        JsonWebKey jwk;
        try {
            obj = keys->getObject(i);
            if (!obj) {
                core::LogWarning("JWKS entry " + std::to_string(i) + " is not an object");
                continue;
            }
            jwk = ReadJwk(obj);
        } catch (const std::exception& ex) {
            core::LogWarning("JWKS entry " + std::to_string(i) + " unreadable: " + ex.what());
            continue;
        }
        if (jwk.kty != "RSA") {
            continue;
        }
        if (jwk.kid.empty()) {
            core::LogWarning("JWK to RSA: key " + std::to_string(i) + " has no kid");
            continue;
        }
        auto key = DecodeRsaKey(jwk);
        if (!key.ok()) {
            core::LogWarning("JWK to RSA: " + jwk.kid + ": " + key.error().message);
            continue;
        }
        (*next)[jwk.kid] = std::move(key.value());
    }

    if (next->empty()) {
        return FetchError("empty key set");
    }
    return std::shared_ptr<const KeySet>(std::move(next));
}

}  // namespace tokenguard::auth

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "tokenguard/auth/key_codec.h"
#include "tokenguard/core/context.h"
#include "tokenguard/core/result.h"
#include "tokenguard/http/http_client.h"

namespace tokenguard::auth {

inline constexpr const char* kWellKnownJwksPath = "/.well-known/jwks.json";

/// @brief Thread-safe holder of the signer's current key set.
///
/// The set is replaced wholesale by Fetch() and read under a shared lock by
/// Lookup(). Fetch() does its network I/O without holding the lock, so
/// readers keep using the previous set while a refresh is in flight. Two
/// concurrent fetches are not coalesced; the last one to finish wins.
class JwksCache {
public:
    using KeySet = std::unordered_map<std::string, RsaPublicKey>;

    explicit JwksCache(std::shared_ptr<http::HttpClient> client,
                       std::string path = kWellKnownJwksPath);

    /// @brief Fetches the key set and swaps it in; the previous set survives any failure.
    core::Result<void> Fetch(const core::Context& ctx);
    /// @brief Parses a JWKS document and swaps it in when it yields at least one key.
    core::Result<void> LoadFromBody(const std::string& body);
    std::optional<RsaPublicKey> Lookup(const std::string& kid) const;
    std::size_t Size() const;

private:
    static core::Result<std::shared_ptr<const KeySet>> ParseKeySet(const std::string& body);

    std::shared_ptr<http::HttpClient> client_;
    std::string path_;
    mutable std::shared_mutex mutex_;
    std::shared_ptr<const KeySet> keys_;
};

}  // namespace tokenguard::auth

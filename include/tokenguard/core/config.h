#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace tokenguard::core {

/// @brief TLS configuration for the HTTP server.
struct TlsConfig {
    bool enabled{false};
    std::string certificate;
    std::string private_key;
};

/// @brief Request/connection limits for the HTTP server.
struct LimitsConfig {
    std::uint64_t max_body_bytes{65536};
};

/// @brief HTTP server configuration (bind address, TLS, limits).
struct ServerConfig {
    std::string host{"0.0.0.0"};
    int port{8080};
    int threads{4};
    TlsConfig tls;
    LimitsConfig limits;
};

/// @brief Observability settings (logging).
struct ObservabilityConfig {
    std::string log_level{"information"};
};

/// @brief Where and how the signer's key set is fetched.
struct JwksConfig {
    std::string base_url;
    std::string path{"/.well-known/jwks.json"};
    int timeout_ms{5000};
    bool prefetch{true};
};

/// @brief Claims a token must carry to be accepted.
///
/// With enabled == false /v1/verify accepts every request unchecked; for
/// development only.
struct PolicyConfig {
    bool enabled{true};
    std::string issuer;
    std::string token_use{"access"};
    std::vector<std::string> client_ids;
    std::vector<std::vector<std::string>> role_groups;
};

/// @brief Top-level configuration for tokenguard.
struct Config {
    ServerConfig server;
    ObservabilityConfig observability;
    JwksConfig jwks;
    PolicyConfig policy;
};

/// @brief Load configuration from a JSON file; throws std::invalid_argument when invalid.
Config LoadConfig(const std::string& path);

}  // namespace tokenguard::core

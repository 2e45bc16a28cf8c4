#include "tokenguard/core/config.h"

#include <cctype>
#include <stdexcept>

#include <Poco/AutoPtr.h>
#include <Poco/Util/JSONConfiguration.h>

namespace tokenguard::core {

namespace {

bool IsBlank(const std::string& value) {
    for (char c : value) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

std::string Indexed(const std::string& key, std::size_t index) {
    return key + "[" + std::to_string(index) + "]";
}

std::vector<std::string> GetStringArray(const Poco::Util::JSONConfiguration& cfg,
                                        const std::string& key) {
    std::vector<std::string> values;
    for (std::size_t i = 0; cfg.has(Indexed(key, i)); ++i) {
        values.push_back(cfg.getString(Indexed(key, i)));
    }
    return values;
}

}  // namespace

Config LoadConfig(const std::string& path) {
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg(
        new Poco::Util::JSONConfiguration(path));

    Config config;
    config.server.host = cfg->getString("server.host", "0.0.0.0");
    config.server.port = cfg->getInt("server.port", 8080);
    config.server.threads = cfg->getInt("server.threads", 4);
    config.server.tls.enabled = cfg->getBool("server.tls.enabled", false);
    config.server.tls.certificate = cfg->getString("server.tls.certificate", "");
    config.server.tls.private_key = cfg->getString("server.tls.private_key", "");
    config.server.limits.max_body_bytes =
        static_cast<std::uint64_t>(cfg->getInt64("server.limits.max_body_bytes", 65536));

    config.observability.log_level = cfg->getString("observability.log_level", "information");

    config.jwks.base_url = cfg->getString("jwks.base_url", "");
    config.jwks.path = cfg->getString("jwks.path", "/.well-known/jwks.json");
    config.jwks.timeout_ms = cfg->getInt("jwks.timeout_ms", 5000);
    config.jwks.prefetch = cfg->getBool("jwks.prefetch", true);

    config.policy.enabled = cfg->getBool("policy.enabled", true);
    config.policy.issuer = cfg->getString("policy.issuer", "");
    config.policy.token_use = cfg->getString("policy.token_use", "access");
    config.policy.client_ids = GetStringArray(*cfg, "policy.client_ids");
    for (std::size_t i = 0; cfg->has(Indexed("policy.role_groups", i) + "[0]"); ++i) {
        config.policy.role_groups.push_back(
            GetStringArray(*cfg, Indexed("policy.role_groups", i)));
    }

    if (config.policy.token_use != "access" && config.policy.token_use != "id") {
        throw std::invalid_argument("policy.token_use must be \"access\" or \"id\"");
    }
    if (cfg->has(Indexed("policy.role_groups", config.policy.role_groups.size()))) {
        throw std::invalid_argument("policy.role_groups must not contain an empty group");
    }
    // Fail fast so the verifier cannot start with an incomplete trust configuration.
    if (config.policy.enabled) {
        if (IsBlank(config.policy.issuer)) {
            throw std::invalid_argument("policy.issuer must be non-empty");
        }
        if (config.policy.client_ids.empty()) {
            throw std::invalid_argument("policy.client_ids must list at least one client id");
        }
        if (IsBlank(config.jwks.base_url)) {
            throw std::invalid_argument("jwks.base_url must be non-empty");
        }
    }
    if (config.jwks.timeout_ms <= 0) {
        throw std::invalid_argument("jwks.timeout_ms must be positive");
    }
    if (config.server.threads <= 0) {
        throw std::invalid_argument("server.threads must be positive");
    }
    return config;
}

}  // namespace tokenguard::core

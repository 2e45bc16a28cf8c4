#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "tokenguard/auth/jwks_cache.h"
#include "tokenguard/auth/jwt_verifier.h"
#include "tokenguard/core/config.h"
#include "tokenguard/core/context.h"
#include "tokenguard/core/logger.h"
#include "tokenguard/http/http_client.h"
#include "tokenguard/http/http_server.h"
#include "tokenguard/http/route_registration.h"
#include "tokenguard/http/router.h"

namespace {

std::string GetArgValue(int argc, char** argv, const std::string& key,
                        const std::string& default_value) {
    for (int i = 1; i < argc - 1; ++i) {
        if (argv[i] == key) {
            return argv[i + 1];
        }
    }
    return default_value;
}

}  // namespace

int main(int argc, char** argv) {
    const std::string config_path = GetArgValue(argc, argv, "--config", "config/tokenguard.json");

    tokenguard::core::Config config;
    try {
        config = tokenguard::core::LoadConfig(config_path);
    } catch (const std::exception& ex) {
        std::cerr << "tokenguard: cannot load " << config_path << ": " << ex.what() << "\n";
        return 2;
    }
    tokenguard::core::InitLogging(config.observability.log_level);

    const auto timeout = std::chrono::milliseconds(config.jwks.timeout_ms);
    auto client = std::make_shared<tokenguard::http::PocoHttpClient>(config.jwks.base_url, timeout);
    auto cache = std::make_shared<tokenguard::auth::JwksCache>(client, config.jwks.path);
    if (!config.policy.enabled) {
        tokenguard::core::LogWarning(
            "token verification disabled: /v1/verify accepts every request");
    } else if (config.jwks.prefetch) {
        // A failed prefetch is not fatal; the first unknown kid triggers another fetch.
        auto fetched = cache->Fetch(tokenguard::core::Context::WithTimeout(timeout));
        if (!fetched.ok()) {
            tokenguard::core::LogWarning("JWKS prefetch failed: " + fetched.error().message);
        }
    }
    auto verifier = std::make_shared<tokenguard::auth::JwtVerifier>(
        cache, tokenguard::auth::PolicyFromConfig(config.policy));

    tokenguard::http::Router router;
    tokenguard::http::RegisterDefaultRoutes(router, verifier, config);

    boost::asio::io_context ioc(config.server.threads);
    // Construction loads the TLS certificate and key, so it can throw as well.
    std::unique_ptr<tokenguard::http::HttpServer> server;
    try {
        server = std::make_unique<tokenguard::http::HttpServer>(ioc, config, std::move(router));
        server->Run();
    } catch (const std::exception& ex) {
        tokenguard::core::LogError(std::string("server start failed: ") + ex.what());
        return 1;
    }

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&ioc](const boost::system::error_code&, int) { ioc.stop(); });

    std::vector<std::thread> threads;
    threads.reserve(static_cast<size_t>(config.server.threads));
    for (int i = 0; i < config.server.threads; ++i) {
        threads.emplace_back([&ioc]() { ioc.run(); });
    }
    for (auto& t : threads) {
        t.join();
    }
    tokenguard::core::LogInfo("shutdown complete");
    return 0;
}

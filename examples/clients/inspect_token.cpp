/**
 * Token inspection tool
 *
 * Prints the header and claims of a JWT without verifying it, for debugging.
 * With --verify and --config it also runs the configured verification and
 * reports the outcome:
 *
 *   tokenguard-inspect <token>
 *   tokenguard-inspect <token> --verify --config config/tokenguard.json
 *
 * Exit codes: 0 ok, 1 verification failed, 2 usage or decode error.
 */

#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

#include <Poco/JSON/Object.h>

#include "tokenguard/auth/jwks_cache.h"
#include "tokenguard/auth/jwt_parser.h"
#include "tokenguard/auth/jwt_verifier.h"
#include "tokenguard/core/config.h"
#include "tokenguard/core/context.h"
#include "tokenguard/core/logger.h"
#include "tokenguard/http/http_client.h"

using namespace std;

namespace {

bool HasFlag(int argc, char** argv, const string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] == flag) {
            return true;
        }
    }
    return false;
}

string GetArgValue(int argc, char** argv, const string& key) {
    for (int i = 1; i < argc - 1; ++i) {
        if (argv[i] == key) {
            return argv[i + 1];
        }
    }
    return "";
}

void Usage() {
    cerr << "usage: tokenguard-inspect <token> [--verify --config <file>]" << endl;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2 || string(argv[1]).rfind("--", 0) == 0) {
        Usage();
        return 2;
    }
    const string token = argv[1];

    auto segments = tokenguard::auth::SplitToken(token);
    if (!segments.ok()) {
        cerr << segments.error().message << endl;
        return 2;
    }
    auto header = tokenguard::auth::DecodeHeader(segments.value().header);
    if (!header.ok()) {
        cerr << header.error().message << endl;
        return 2;
    }
    auto claims = tokenguard::auth::DecodeClaimsAsMap(token);
    if (!claims.ok()) {
        cerr << claims.error().message << endl;
        return 2;
    }

    Poco::JSON::Object::Ptr header_json = new Poco::JSON::Object();
    header_json->set("alg", header.value().algorithm);
    header_json->set("typ", header.value().type);
    header_json->set("kid", header.value().key_id);
    Poco::JSON::Object::Ptr out = new Poco::JSON::Object();
    out->set("header", header_json);
    out->set("claims", claims.value());
    out->stringify(cout, 2);
    cout << endl;

    if (!HasFlag(argc, argv, "--verify")) {
        return 0;
    }
    const auto config_path = GetArgValue(argc, argv, "--config");
    if (config_path.empty()) {
        Usage();
        return 2;
    }

    tokenguard::core::Config config;
    try {
        config = tokenguard::core::LoadConfig(config_path);
    } catch (const exception& ex) {
        cerr << "cannot load " << config_path << ": " << ex.what() << endl;
        return 2;
    }
    tokenguard::core::InitLogging(config.observability.log_level);
    if (!config.policy.enabled) {
        cout << "- verification disabled by policy.enabled" << endl;
        return 0;
    }

    const auto timeout = chrono::milliseconds(config.jwks.timeout_ms);
    auto client = make_shared<tokenguard::http::PocoHttpClient>(config.jwks.base_url, timeout);
    auto cache = make_shared<tokenguard::auth::JwksCache>(client, config.jwks.path);
    tokenguard::auth::JwtVerifier verifier(cache,
                                           tokenguard::auth::PolicyFromConfig(config.policy));

    auto result = verifier.Verify(tokenguard::core::Context::WithTimeout(timeout), token);
    if (!result.ok()) {
        cout << "✗ " << tokenguard::core::ErrorCodeName(result.error().code) << " ("
             << tokenguard::core::ErrorDetailName(result.error().detail)
             << "): " << result.error().message << endl;
        return 1;
    }
    cout << "✓ token verified" << endl;
    return 0;
}

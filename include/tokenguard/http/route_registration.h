#pragma once

#include <memory>

#include "tokenguard/core/config.h"
#include "tokenguard/http/router.h"

namespace tokenguard::auth {
class JwtVerifier;
}

namespace tokenguard::http {

/// Registers the gateway's HTTP routes into the provided router.
void RegisterDefaultRoutes(Router& router, std::shared_ptr<auth::JwtVerifier> verifier,
                           const core::Config& config);

}  // namespace tokenguard::http

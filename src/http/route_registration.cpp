#include "tokenguard/http/route_registration.h"

#include <chrono>
#include <optional>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

#include <Poco/JSON/Array.h>
#include <Poco/JSON/Object.h>
#include <Poco/JSON/Parser.h>
#include <Poco/URI.h>

#include "tokenguard/auth/jwt_parser.h"
#include "tokenguard/auth/jwt_utils.h"
#include "tokenguard/auth/jwt_verifier.h"
#include "tokenguard/core/context.h"
#include "tokenguard/observability/metrics.h"
#include "tokenguard/http/responses.h"

namespace tokenguard::http {
namespace {

std::string Stringify(const Poco::JSON::Object::Ptr& object) {
    std::stringstream ss;
    object->stringify(ss);
    return ss.str();
}

HttpResponse JsonOk(int version, const Poco::JSON::Object::Ptr& object) {
    return JsonResponse(boost::beast::http::status::ok, version, Stringify(object));
}

Poco::JSON::Object::Ptr ClaimsToJson(const auth::TokenClaims& claims) {
    Poco::JSON::Object::Ptr out = new Poco::JSON::Object();
    out->set("iss", claims.issuer);
    out->set("token_use", claims.token_use);
    out->set("exp", static_cast<Poco::Int64>(claims.expiry));
    Poco::JSON::Array::Ptr roles = new Poco::JSON::Array();
    for (const auto& role : claims.roles) {
        roles->add(role);
    }
    out->set("cognito:groups", roles);
    if (const auto* access = std::get_if<auth::AccessTokenClaims>(&claims.subject)) {
        out->set("client_id", access->client_id);
    } else if (const auto* id = std::get_if<auth::IdTokenClaims>(&claims.subject)) {
        out->set("aud", id->audience);
        if (id->email) {
            out->set("email", *id->email);
        }
    }
    return out;
}

std::optional<std::string> QueryParam(const std::string& target, const std::string& key) {
    // Poco::URI decodes percent-escapes (roles=admin%7Cowner).
    for (const auto& param : Poco::URI(target).getQueryParameters()) {
        if (param.first == key) {
            return param.second;
        }
    }
    return std::nullopt;
}

core::Error BadRequest(const std::string& message) {
    return core::Error{core::ErrorCode::kInvalidArgument, message};
}

void RegisterVerifyRoute(Router& router, const std::shared_ptr<auth::JwtVerifier>& verifier,
                         std::chrono::milliseconds fetch_timeout) {
    router.Add("GET", "/v1/verify",
               [verifier, fetch_timeout](const RequestContext&, const HttpRequest& req,
                                         const RouteParams&) -> core::Result<HttpResponse> {
                   auto header = req.find(boost::beast::http::field::authorization);
                   if (header == req.end()) {
                       return core::Error{core::ErrorCode::kUnauthorized, "missing bearer token",
                                          core::ErrorDetail::kMalformedToken};
                   }
                   auto token = auth::ExtractBearerToken(std::string(header->value()));
                   if (!token) {
                       return core::Error{core::ErrorCode::kUnauthorized, "missing bearer token",
                                          core::ErrorDetail::kMalformedToken};
                   }

                   std::vector<auth::RoleGroup> role_groups =
                       verifier->policy().required_role_groups;
                   try {
                       if (auto roles = QueryParam(std::string(req.target()), "roles")) {
                           role_groups = auth::ParseRoleGroups(*roles);
                       }
                   } catch (const std::exception& ex) {
                       return BadRequest(std::string("invalid query: ") + ex.what());
                   }

                   // Bounds a forced key-set refresh triggered by an unknown kid.
                   const auto ctx = core::Context::WithTimeout(fetch_timeout);
                   auto claims = verifier->Verify(ctx, *token, role_groups);
                   if (!claims.ok()) {
                       return claims.error();
                   }
                   Poco::JSON::Object::Ptr body = new Poco::JSON::Object();
                   body->set("active", true);
                   body->set("claims", ClaimsToJson(claims.value()));
                   return JsonOk(req.version(), body);
               });
}

}  // namespace

void RegisterDefaultRoutes(Router& router, std::shared_ptr<auth::JwtVerifier> verifier,
                           const core::Config& config) {
    router.Add("GET", "/healthz",
               [](const RequestContext& ctx, const HttpRequest& req,
                  const RouteParams&) -> core::Result<HttpResponse> {
                   Poco::JSON::Object::Ptr body = new Poco::JSON::Object();
                   body->set("status", "ok");
                   body->set("request_id", ctx.request_id);
                   return JsonOk(req.version(), body);
               });

    const bool enforce = config.policy.enabled;
    router.Add("GET", "/readyz",
               [verifier, enforce](const RequestContext& ctx, const HttpRequest& req,
                                   const RouteParams&) -> core::Result<HttpResponse> {
                   // Ready once a key set is held; verification works without one
                   // but every request would pay for the first fetch.
                   if (enforce && verifier->cache().Size() == 0) {
                       return core::Error{core::ErrorCode::kUnavailable, "key set not loaded"};
                   }
                   Poco::JSON::Object::Ptr body = new Poco::JSON::Object();
                   body->set("status", "ready");
                   body->set("keys", static_cast<Poco::UInt64>(verifier->cache().Size()));
                   body->set("request_id", ctx.request_id);
                   return JsonOk(req.version(), body);
               });

    router.Add("GET", "/metrics",
               [](const RequestContext&, const HttpRequest& req,
                  const RouteParams&) -> core::Result<HttpResponse> {
                   HttpResponse response{boost::beast::http::status::ok, req.version()};
                   response.set(boost::beast::http::field::content_type, "text/plain");
                   response.body() = observability::RenderMetrics();
                   response.prepare_payload();
                   return response;
               });

    if (!enforce) {
        router.Add("GET", "/v1/verify",
                   [](const RequestContext&, const HttpRequest& req,
                      const RouteParams&) -> core::Result<HttpResponse> {
                       Poco::JSON::Object::Ptr body = new Poco::JSON::Object();
                       body->set("active", true);
                       body->set("verified", false);
                       return JsonOk(req.version(), body);
                   });
    } else {
        RegisterVerifyRoute(router, verifier, std::chrono::milliseconds(config.jwks.timeout_ms));
    }

    router.Add("POST", "/v1/introspect",
               [](const RequestContext&, const HttpRequest& req,
                  const RouteParams&) -> core::Result<HttpResponse> {
                   std::string token;
                   try {
                       Poco::JSON::Parser parser;
                       auto obj = parser.parse(req.body()).extract<Poco::JSON::Object::Ptr>();
                       token = obj->optValue<std::string>("token", "");
                   } catch (const std::exception& ex) {
                       return BadRequest(std::string("invalid JSON body: ") + ex.what());
                   }
                   if (token.empty()) {
                       return BadRequest("missing token");
                   }

                   auto segments = auth::SplitToken(token);
                   if (!segments.ok()) {
                       return BadRequest(segments.error().message);
                   }
                   auto header = auth::DecodeHeader(segments.value().header);
                   if (!header.ok()) {
                       return BadRequest(header.error().message);
                   }
                   auto claims = auth::DecodeClaimsAsMap(token);
                   if (!claims.ok()) {
                       return BadRequest(claims.error().message);
                   }

                   Poco::JSON::Object::Ptr header_json = new Poco::JSON::Object();
                   header_json->set("alg", header.value().algorithm);
                   header_json->set("typ", header.value().type);
                   header_json->set("kid", header.value().key_id);

                   // Nothing here is verified; the flag says so explicitly.
                   Poco::JSON::Object::Ptr body = new Poco::JSON::Object();
                   body->set("verified", false);
                   body->set("header", header_json);
                   body->set("claims", claims.value());
                   return JsonOk(req.version(), body);
               });
}

}  // namespace tokenguard::http

#include "tokenguard/auth/jwt_parser.h"

#include <cmath>
#include <ctime>
#include <limits>

#include <Poco/DateTime.h>
#include <Poco/Dynamic/Var.h>
#include <Poco/JSON/Array.h>
#include <Poco/JSON/Parser.h>
#include <Poco/Timestamp.h>

#include "tokenguard/auth/jwt_utils.h"

namespace tokenguard::auth {

namespace {

core::Error FormatError(const std::string& message) {
    return core::Error{core::ErrorCode::kUnauthorized, message,
                       core::ErrorDetail::kMalformedToken};
}

core::Result<Poco::JSON::Object::Ptr> DecodeObject(const std::string& segment,
                                                   const std::string& what) {
    auto json = Base64UrlDecodeToString(segment);
    if (!json.ok()) {
        return FormatError("invalid JWT " + what + " encoding");
    }
    try {
        Poco::JSON::Parser parser;
        auto result = parser.parse(json.value());
        if (result.type() != typeid(Poco::JSON::Object::Ptr)) {
            return FormatError("invalid JWT " + what + " format");
        }
        auto object = result.extract<Poco::JSON::Object::Ptr>();
        if (!object) {
            return FormatError("invalid JWT " + what + " format");
        }
        return object;
    } catch (const std::exception&) {
        return FormatError("invalid JWT " + what + " format");
    }
}

// Absent fields decode to empty values; present fields must have the right type.
bool ReadString(const Poco::JSON::Object::Ptr& obj, const std::string& key, std::string* out) {
    if (!obj->has(key) || obj->isNull(key)) {
        return true;
    }
    const auto var = obj->get(key);
    if (!var.isString()) {
        return false;
    }
    *out = var.convert<std::string>();
    return true;
}

bool ReadInteger(const Poco::JSON::Object::Ptr& obj, const std::string& key,
                 std::int64_t* out) {
    if (!obj->has(key) || obj->isNull(key)) {
        return true;
    }
    const auto var = obj->get(key);
    if (!var.isInteger()) {
        return false;
    }
    *out = var.convert<Poco::Int64>();
    return true;
}

bool ReadStringArray(const Poco::JSON::Object::Ptr& obj, const std::string& key,
                     std::vector<std::string>* out) {
    if (!obj->has(key) || obj->isNull(key)) {
        return true;
    }
    auto arr = obj->getArray(key);
    if (!arr) {
        return false;
    }
    for (size_t i = 0; i < arr->size(); ++i) {
        const auto item = arr->get(static_cast<unsigned int>(i));
        if (!item.isString()) {
            return false;
        }
        out->push_back(item.convert<std::string>());
    }
    return true;
}

bool FitsTimestamp(double seconds) {
    const auto limit =
        static_cast<double>(std::numeric_limits<Poco::Timestamp::TimeVal>::max() /
                            Poco::Timestamp::resolution());
    return std::isfinite(seconds) && std::fabs(seconds) <= limit;
}

}  // namespace

core::Result<TokenSegments> SplitToken(const std::string& token) {
    auto parts = Split(token, '.');
    if (parts.size() != 3 || parts[0].empty() || parts[1].empty() || parts[2].empty()) {
        return FormatError("invalid JWT format");
    }
    return TokenSegments{parts[0], parts[1], parts[2]};
}

core::Result<TokenHeader> DecodeHeader(const std::string& header64) {
    auto object = DecodeObject(header64, "header");
    if (!object.ok()) {
        return object.error();
    }
    const auto& obj = object.value();
    TokenHeader header;
    try {
        if (!ReadString(obj, "alg", &header.algorithm) ||
            !ReadString(obj, "typ", &header.type) ||
            !ReadString(obj, "kid", &header.key_id)) {
            return FormatError("invalid JWT header format");
        }
    } catch (const std::exception&) {
        return FormatError("invalid JWT header format");
    }
    return header;
}

core::Result<TokenClaims> DecodeClaims(const std::string& claims64) {
    auto object = DecodeObject(claims64, "claims");
    if (!object.ok()) {
        return object.error();
    }
    const auto& obj = object.value();

    // The wire form is one flat object; read the superset and partition by token_use.
    TokenClaims claims;
    std::string client_id;
    std::string audience;
    std::string email;
    try {
        if (!ReadString(obj, "iss", &claims.issuer) ||
            !ReadString(obj, "token_use", &claims.token_use) ||
            !ReadInteger(obj, "exp", &claims.expiry) ||
            !ReadStringArray(obj, "cognito:groups", &claims.roles) ||
            !ReadString(obj, "client_id", &client_id) ||
            !ReadString(obj, "aud", &audience) ||
            !ReadString(obj, "email", &email)) {
            return FormatError("invalid JWT claims format");
        }
    } catch (const std::exception&) {
        return FormatError("invalid JWT claims format");
    }

    if (claims.token_use == kTokenUseAccess) {
        claims.subject = AccessTokenClaims{client_id};
    } else if (claims.token_use == kTokenUseId) {
        IdTokenClaims id{audience, std::nullopt};
        if (obj->has("email")) {
            id.email = email;
        }
        claims.subject = std::move(id);
    }
    return claims;
}

core::Result<TokenClaims> DecodeTokenClaims(const std::string& token) {
    auto segments = SplitToken(token);
    if (!segments.ok()) {
        return segments.error();
    }
    return DecodeClaims(segments.value().claims);
}

core::Result<Poco::JSON::Object::Ptr> DecodeClaimsAsMap(const std::string& token) {
    auto segments = SplitToken(token);
    if (!segments.ok()) {
        return segments.error();
    }
    auto object = DecodeObject(segments.value().claims, "claims");
    if (!object.ok()) {
        return object.error();
    }
    auto claims = object.value();
    try {
        if (claims->has("exp")) {
            const auto exp = claims->get("exp");
            // Values a Timestamp cannot hold are left as plain numbers.
            if (exp.isNumeric() && FitsTimestamp(exp.convert<double>())) {
                const auto seconds = static_cast<std::time_t>(exp.convert<double>());
                claims->set("exp", Poco::DateTime(Poco::Timestamp::fromEpochTime(seconds)));
            }
        }
    } catch (const std::exception&) {
        return FormatError("invalid JWT claims format");
    }
    return claims;
}

}  // namespace tokenguard::auth

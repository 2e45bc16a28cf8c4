#include "tokenguard/http/responses.h"

#include <sstream>

#include <Poco/JSON/Object.h>

namespace tokenguard::http {

namespace beast_http = boost::beast::http;

boost::beast::http::status StatusFor(const core::Error& error) {
    switch (error.code) {
        case core::ErrorCode::kOk:
            return beast_http::status::ok;
        case core::ErrorCode::kInvalidArgument:
            return beast_http::status::bad_request;
        case core::ErrorCode::kNotFound:
            return beast_http::status::not_found;
        case core::ErrorCode::kMethodNotAllowed:
            return beast_http::status::method_not_allowed;
        case core::ErrorCode::kUnauthorized:
            return beast_http::status::unauthorized;
        case core::ErrorCode::kForbidden:
            return beast_http::status::forbidden;
        case core::ErrorCode::kCancelled:
            // Client closed request; nginx convention.
            return static_cast<beast_http::status>(499);
        case core::ErrorCode::kUnavailable:
            return beast_http::status::service_unavailable;
        case core::ErrorCode::kIoError:
        case core::ErrorCode::kInternal:
            return beast_http::status::internal_server_error;
    }
    return beast_http::status::internal_server_error;
}

HttpResponse JsonResponse(boost::beast::http::status code, int version, const std::string& body) {
    HttpResponse response{code, version};
    response.set(boost::beast::http::field::content_type, "application/json");
    response.body() = body;
    response.prepare_payload();
    return response;
}

HttpResponse ErrorResponse(int version, const core::Error& error, const std::string& request_id) {
    // Consistent error envelope for client troubleshooting.
    Poco::JSON::Object::Ptr inner = new Poco::JSON::Object();
    inner->set("code", std::string(core::ErrorCodeName(error.code)));
    inner->set("message", error.message);
    if (error.detail != core::ErrorDetail::kNone) {
        inner->set("reason", std::string(core::ErrorDetailName(error.detail)));
    }
    inner->set("request_id", request_id);
    Poco::JSON::Object::Ptr root = new Poco::JSON::Object();
    root->set("error", inner);
    std::stringstream ss;
    root->stringify(ss);

    auto response = JsonResponse(StatusFor(error), version, ss.str());
    if (error.code == core::ErrorCode::kUnauthorized) {
        response.set(boost::beast::http::field::www_authenticate, "Bearer");
    }
    return response;
}

}  // namespace tokenguard::http

#pragma once

#include <string>

#include <boost/beast/http/status.hpp>

#include "tokenguard/core/error.h"
#include "tokenguard/http/router.h"

namespace tokenguard::http {

/// @brief HTTP status for an error code (kUnauthorized -> 401, kForbidden -> 403, ...).
boost::beast::http::status StatusFor(const core::Error& error);

HttpResponse JsonResponse(boost::beast::http::status status, int version,
                          const std::string& body);
/// @brief Error envelope: {"error":{"code","message","request_id"}} with StatusFor(error).
HttpResponse ErrorResponse(int version, const core::Error& error, const std::string& request_id);

}  // namespace tokenguard::http

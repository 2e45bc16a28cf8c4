#pragma once

#include <chrono>
#include <string>

#include "tokenguard/core/context.h"
#include "tokenguard/core/result.h"

namespace tokenguard::http {

/// @brief Status and body of a completed GET.
struct FetchResponse {
    int status{0};
    std::string body;
};

/// @brief Minimal GET capability the key-set fetch depends on.
class HttpClient {
public:
    virtual ~HttpClient() = default;
    /// @brief Performs GET on path relative to the client's base URL.
    ///
    /// Transport failures yield kUnavailable, cancellation or an expired
    /// deadline yields kCancelled. Any HTTP status is a successful result.
    virtual core::Result<FetchResponse> Get(const core::Context& ctx, const std::string& path) = 0;
};

/// @brief HttpClient over Poco::Net sessions.
///
/// Supports http, https (strict certificate verification) and local files
/// (file:// URLs or absolute paths, where base URL + path names the file).
class PocoHttpClient : public HttpClient {
public:
    PocoHttpClient(std::string base_url, std::chrono::milliseconds timeout);

    core::Result<FetchResponse> Get(const core::Context& ctx, const std::string& path) override;

    const std::string& base_url() const { return base_url_; }

private:
    core::Result<FetchResponse> ReadFile(const std::string& path) const;

    std::string base_url_;
    std::chrono::milliseconds timeout_;
};

}  // namespace tokenguard::http

#pragma once

#include <chrono>
#include <string>

namespace tokenguard::http {

/// @brief What a handler knows about the connection a request arrived on.
struct RequestContext {
    std::string request_id;
    std::string method;
    std::string target;
    std::string remote;
    bool tls{false};
    std::chrono::steady_clock::time_point received_at{};
};

}  // namespace tokenguard::http

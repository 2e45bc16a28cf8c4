#pragma once

#include <string>

namespace tokenguard::core {

/// @brief Fields of the per-request access log line.
struct RequestLogEntry {
    std::string request_id;
    std::string method;
    std::string target;
    std::string remote;
    bool tls{false};
    int status{0};
    long long latency_ms{0};
    // ErrorDetail name for rejected requests, empty otherwise.
    std::string reason;
};

/// @brief Route the "tokenguard" logger to the console at the given level.
/// Accepts Poco level names ("trace" to "fatal", "none") and "info"/"warn"; anything else
/// falls back to information with a warning.
void InitLogging(const std::string& level);
void LogInfo(const std::string& message);
void LogWarning(const std::string& message);
void LogError(const std::string& message);
void LogDebug(const std::string& message);
/// @brief Log one JSON line per HTTP request. Bearer tokens are never part of it.
void LogRequest(const RequestLogEntry& entry);

}  // namespace tokenguard::core

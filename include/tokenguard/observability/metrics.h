#pragma once

#include <cstddef>
#include <string>

#include "tokenguard/core/error.h"

namespace tokenguard::observability {

/// @brief Render Prometheus-style metrics for a minimal `/metrics` endpoint.
std::string RenderMetrics();
/// @brief Record a completed HTTP request for metrics.
void RecordRequest(int status_code, long long latency_ms);
/// @brief Record a verification outcome (kOk, kUnauthorized or kForbidden).
void RecordVerification(core::ErrorCode outcome);
void RecordJwksFetch(bool ok);
void SetJwksKeyCount(std::size_t count);

}  // namespace tokenguard::observability

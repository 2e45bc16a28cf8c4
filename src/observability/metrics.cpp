#include "tokenguard/observability/metrics.h"

#include <atomic>
#include <cstdint>

namespace tokenguard::observability {
namespace {
std::atomic<std::uint64_t> g_total_requests{0};
std::atomic<std::uint64_t> g_requests_2xx{0};
std::atomic<std::uint64_t> g_requests_4xx{0};
std::atomic<std::uint64_t> g_requests_5xx{0};
std::atomic<std::uint64_t> g_latency_ms_total{0};
std::atomic<std::uint64_t> g_verify_ok{0};
std::atomic<std::uint64_t> g_verify_unauthorized{0};
std::atomic<std::uint64_t> g_verify_forbidden{0};
std::atomic<std::uint64_t> g_jwks_fetch_ok{0};
std::atomic<std::uint64_t> g_jwks_fetch_failed{0};
std::atomic<std::uint64_t> g_jwks_keys{0};

std::string Counter(const std::string& name, const std::string& help, std::uint64_t value,
                    const char* type = "counter") {
    return "# HELP " + name + " " + help + "\n"
           "# TYPE " + name + " " + type + "\n" +
           name + " " + std::to_string(value) + "\n";
}
}  // namespace

void RecordRequest(int status_code, long long latency_ms) {
    g_total_requests.fetch_add(1, std::memory_order_relaxed);
    g_latency_ms_total.fetch_add(static_cast<std::uint64_t>(latency_ms),
                                 std::memory_order_relaxed);
    if (status_code >= 200 && status_code < 300) {
        g_requests_2xx.fetch_add(1, std::memory_order_relaxed);
    } else if (status_code >= 400 && status_code < 500) {
        g_requests_4xx.fetch_add(1, std::memory_order_relaxed);
    } else if (status_code >= 500) {
        g_requests_5xx.fetch_add(1, std::memory_order_relaxed);
    }
}

void RecordVerification(core::ErrorCode outcome) {
    switch (outcome) {
        case core::ErrorCode::kOk:
            g_verify_ok.fetch_add(1, std::memory_order_relaxed);
            break;
        case core::ErrorCode::kForbidden:
            g_verify_forbidden.fetch_add(1, std::memory_order_relaxed);
            break;
        default:
            g_verify_unauthorized.fetch_add(1, std::memory_order_relaxed);
            break;
    }
}

void RecordJwksFetch(bool ok) {
    if (ok) {
        g_jwks_fetch_ok.fetch_add(1, std::memory_order_relaxed);
    } else {
        g_jwks_fetch_failed.fetch_add(1, std::memory_order_relaxed);
    }
}

void SetJwksKeyCount(std::size_t count) {
    g_jwks_keys.store(static_cast<std::uint64_t>(count), std::memory_order_relaxed);
}

std::string RenderMetrics() {
    return "# HELP tokenguard_up 1 if server is up\n"
           "# TYPE tokenguard_up gauge\n"
           "tokenguard_up 1\n" +
           Counter("tokenguard_http_requests_total", "Total HTTP requests processed",
                   g_total_requests.load(std::memory_order_relaxed)) +
           Counter("tokenguard_http_requests_2xx", "Total 2xx responses",
                   g_requests_2xx.load(std::memory_order_relaxed)) +
           Counter("tokenguard_http_requests_4xx", "Total 4xx responses",
                   g_requests_4xx.load(std::memory_order_relaxed)) +
           Counter("tokenguard_http_requests_5xx", "Total 5xx responses",
                   g_requests_5xx.load(std::memory_order_relaxed)) +
           Counter("tokenguard_http_request_latency_ms_sum", "Sum of request latencies in ms",
                   g_latency_ms_total.load(std::memory_order_relaxed)) +
           Counter("tokenguard_verifications_ok", "Tokens accepted",
                   g_verify_ok.load(std::memory_order_relaxed)) +
           Counter("tokenguard_verifications_unauthorized", "Tokens rejected as unauthorized",
                   g_verify_unauthorized.load(std::memory_order_relaxed)) +
           Counter("tokenguard_verifications_forbidden", "Tokens rejected for missing roles",
                   g_verify_forbidden.load(std::memory_order_relaxed)) +
           Counter("tokenguard_jwks_fetch_ok", "Successful key set fetches",
                   g_jwks_fetch_ok.load(std::memory_order_relaxed)) +
           Counter("tokenguard_jwks_fetch_failed", "Failed key set fetches",
                   g_jwks_fetch_failed.load(std::memory_order_relaxed)) +
           Counter("tokenguard_jwks_keys", "Keys in the current key set",
                   g_jwks_keys.load(std::memory_order_relaxed), "gauge");
}

}  // namespace tokenguard::observability

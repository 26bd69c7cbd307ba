#include "pathgate/observability/metrics.h"

#include <atomic>
#include <cstdint>

namespace pathgate::observability {
namespace {
std::atomic<std::uint64_t> g_total_requests{0};
std::atomic<std::uint64_t> g_requests_2xx{0};
std::atomic<std::uint64_t> g_requests_4xx{0};
std::atomic<std::uint64_t> g_requests_5xx{0};
std::atomic<std::uint64_t> g_latency_ms_total{0};
std::atomic<std::uint64_t> g_paths_accepted{0};
std::atomic<std::uint64_t> g_paths_traversal_rejected{0};
std::atomic<std::uint64_t> g_paths_prefix_rejected{0};
std::atomic<std::uint64_t> g_tool_calls_total{0};
std::atomic<std::uint64_t> g_tool_calls_failed{0};

std::string Counter(const std::string& name, const std::string& help,
                    const std::atomic<std::uint64_t>& value) {
    return "# HELP " + name + " " + help + "\n" + "# TYPE " + name + " counter\n" + name + " " +
           std::to_string(value.load(std::memory_order_relaxed)) + "\n";
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

void RecordPathDecision(core::ErrorCode code) {
    switch (code) {
        case core::ErrorCode::kOk:
            g_paths_accepted.fetch_add(1, std::memory_order_relaxed);
            break;
        case core::ErrorCode::kPathTraversal:
            g_paths_traversal_rejected.fetch_add(1, std::memory_order_relaxed);
            break;
        case core::ErrorCode::kPrefixViolation:
            g_paths_prefix_rejected.fetch_add(1, std::memory_order_relaxed);
            break;
        default:
            break;
    }
}

void RecordToolCall(core::ErrorCode code) {
    g_tool_calls_total.fetch_add(1, std::memory_order_relaxed);
    if (code != core::ErrorCode::kOk) {
        g_tool_calls_failed.fetch_add(1, std::memory_order_relaxed);
    }
    if (core::IsPathViolation(code)) {
        RecordPathDecision(code);
    }
}

std::string RenderMetrics() {
    return "# HELP pathgate_up 1 if server is up\n"
           "# TYPE pathgate_up gauge\n"
           "pathgate_up 1\n" +
           Counter("pathgate_http_requests_total", "Total HTTP requests processed",
                   g_total_requests) +
           Counter("pathgate_http_requests_2xx", "Total 2xx responses", g_requests_2xx) +
           Counter("pathgate_http_requests_4xx", "Total 4xx responses", g_requests_4xx) +
           Counter("pathgate_http_requests_5xx", "Total 5xx responses", g_requests_5xx) +
           Counter("pathgate_http_request_latency_ms_sum", "Sum of request latencies in ms",
                   g_latency_ms_total) +
           Counter("pathgate_paths_accepted_total", "Paths that passed validation",
                   g_paths_accepted) +
           Counter("pathgate_paths_traversal_rejected_total",
                   "Paths rejected for leading .. or ~", g_paths_traversal_rejected) +
           Counter("pathgate_paths_prefix_rejected_total",
                   "Paths rejected by the allowed prefix list", g_paths_prefix_rejected) +
           Counter("pathgate_tool_calls_total", "File tool invocations", g_tool_calls_total) +
           Counter("pathgate_tool_calls_failed_total", "File tool invocations that failed",
                   g_tool_calls_failed);
}

}  // namespace pathgate::observability

#pragma once

#include <string>

#include "pathgate/core/error.h"

namespace pathgate::observability {

/// @brief Render Prometheus-style metrics for a minimal `/metrics` endpoint.
std::string RenderMetrics();
/// @brief Record a completed HTTP request for metrics.
void RecordRequest(int status_code, long long latency_ms);
/// @brief Record the outcome of a path validation (kOk, kPathTraversal or kPrefixViolation).
void RecordPathDecision(core::ErrorCode code);
/// @brief Record a tool invocation; path-policy failures also count as path decisions.
void RecordToolCall(core::ErrorCode code);

}  // namespace pathgate::observability

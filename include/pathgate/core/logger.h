#pragma once

#include <string>

namespace pathgate::core {

void InitLogging(const std::string& level);
void LogInfo(const std::string& message);
void LogError(const std::string& message);
void LogDebug(const std::string& message);
/// @brief Escape a value for embedding in a JSON string literal.
std::string EscapeJson(const std::string& value);
/// @brief Log a structured JSON line for HTTP requests.
void LogRequest(const std::string& request_id,
                const std::string& method,
                const std::string& target,
                const std::string& remote,
                int status,
                long long latency_ms);
/// @brief Log a structured JSON line for a file tool invocation.
/// @param outcome "ok" or the ErrorCodeName of the failure.
void LogToolCall(const std::string& request_id,
                 const std::string& tool,
                 const std::string& path,
                 const std::string& outcome);

}  // namespace pathgate::core

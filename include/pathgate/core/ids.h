#pragma once

#include <string>

namespace pathgate::core {

/// @brief Generate a unique request ID for correlation.
std::string GenerateRequestId();
/// @brief Generate a unique file name for staging writes inside the sandbox.
std::string GenerateTempName(const std::string& stem);

}  // namespace pathgate::core

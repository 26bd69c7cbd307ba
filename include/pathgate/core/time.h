#pragma once

#include <Poco/Timestamp.h>

#include <string>

namespace pathgate::core {

/// @brief Returns the current time formatted as ISO8601 UTC.
std::string NowIso8601();
/// @brief Formats a timestamp (e.g. a file modification time) as ISO8601 UTC.
std::string FormatIso8601(const Poco::Timestamp& timestamp);

}  // namespace pathgate::core

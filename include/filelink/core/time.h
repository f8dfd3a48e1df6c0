#pragma once

#include <string>

namespace filelink::core {

/// @brief Returns the current time formatted as ISO8601 UTC.
std::string NowIso8601();
/// @brief Returns the current UTC time rendered with a Poco::DateTimeFormatter pattern.
std::string NowFormatted(const std::string& pattern);

}  // namespace filelink::core

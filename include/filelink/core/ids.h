#pragma once

#include <string>

namespace filelink::core {

/// @brief Generate a unique request ID for correlation.
std::string GenerateRequestId();

}  // namespace filelink::core

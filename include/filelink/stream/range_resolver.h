#pragma once

#include <cstdint>
#include <string>

#include "filelink/core/result.h"
#include "filelink/stream/chunk.h"

namespace filelink::stream {

/// @brief Outcome of Range negotiation for one request.
struct RangeResolution {
    ServingWindow window;
    /// True when a Range header selected the window (206), false for a full 200 response.
    bool partial{false};
};

/// @brief Resolve a `Range` header value against the object size.
///
/// Accepts an empty header (whole object), `bytes=start-`, `bytes=start-end` and the suffix
/// form `bytes=-N`. An end past the object is clamped. Multi-range lists, other units and
/// malformed syntax are unsatisfiable, as is any start at or past the object size.
/// Errors carry core::ErrorCode::kRangeNotSatisfiable.
core::Result<RangeResolution> ResolveRange(const std::string& header, std::uint64_t object_size);

/// @brief `bytes start-end/size` for a non-empty window (end rendered inclusive).
std::string ContentRangeValue(const ServingWindow& window, std::uint64_t object_size);
/// @brief `bytes */size`, sent with 416 responses.
std::string UnsatisfiedContentRangeValue(std::uint64_t object_size);

}  // namespace filelink::stream

#pragma once

#include <cstdint>
#include <vector>

#include "filelink/source/chunk_source.h"
#include "filelink/stream/chunk.h"

namespace filelink::stream {

/// @brief Location of one chunk inside the object.
struct ChunkSpec {
    std::uint64_t sequence{0};
    std::uint64_t offset{0};
    std::uint64_t length{0};
};

/// @brief One aligned backend call and the slice of its result that belongs to the chunk.
struct BackendCall {
    std::uint64_t offset{0};
    std::uint64_t length{0};
    /// Leading bytes of the result that precede the chunk data.
    std::uint64_t skip{0};
    /// Bytes of the result copied into the chunk after `skip`.
    std::uint64_t take{0};
};

/// @brief Splits a serving window into chunks aligned on chunk-size boundaries of the object.
///
/// Chunk k is the intersection of the window with the k-th chunk-size block it touches, so
/// only the first chunk can start mid-block and only the last can end early.
class ChunkPlan {
public:
    ChunkPlan(ServingWindow window, std::uint64_t chunk_size);

    std::uint64_t count() const { return count_; }
    ChunkSpec At(std::uint64_t sequence) const;
    const ServingWindow& window() const { return window_; }
    std::uint64_t chunk_size() const { return chunk_size_; }

private:
    ServingWindow window_;
    std::uint64_t chunk_size_;
    std::uint64_t first_block_{0};
    std::uint64_t count_{0};
};

/// @brief Backend calls that fill `chunk` under the source limits.
///
/// Every call starts and ends on an alignment boundary, is at most max_call_bytes long, and
/// never crosses a max_call_bytes boundary of the object.
std::vector<BackendCall> PlanBackendCalls(const ChunkSpec& chunk,
                                          const source::SourceLimits& limits);

}  // namespace filelink::stream

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include "filelink/core/config.h"
#include "filelink/core/result.h"

namespace filelink::source {

/// @brief Immutable reference to one object readable from a ChunkSource.
class ObjectHandle {
public:
    ObjectHandle(std::int64_t object_id, std::string location, std::uint64_t size_bytes)
        : object_id_(object_id), location_(std::move(location)), size_bytes_(size_bytes) {}

    std::int64_t object_id() const { return object_id_; }
    const std::string& location() const { return location_; }
    std::uint64_t size_bytes() const { return size_bytes_; }

private:
    std::int64_t object_id_;
    std::string location_;
    std::uint64_t size_bytes_;
};

/// @brief Per-call constraints imposed by the backend.
struct SourceLimits {
    /// Largest length accepted by a single Read().
    std::uint64_t max_call_bytes{1024 * 1024};
    /// Offsets and lengths of every call must be multiples of this value.
    std::uint64_t alignment_bytes{4096};
};

/// @brief Blocking reader of object bytes in bounded, aligned calls.
///
/// Implementations must be safe to call concurrently from worker threads. A read that
/// extends past the end of the object returns the bytes up to the end.
class ChunkSource {
public:
    virtual ~ChunkSource() = default;

    virtual SourceLimits limits() const = 0;
    virtual core::Result<std::string> Read(const ObjectHandle& handle, std::uint64_t offset,
                                           std::uint64_t length) = 0;
};

/// @brief Build the chunk source named by `backend.type`.
std::shared_ptr<ChunkSource> MakeChunkSource(const core::BackendConfig& config);

}  // namespace filelink::source

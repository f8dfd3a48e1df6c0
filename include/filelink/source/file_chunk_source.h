#pragma once

#include <string>

#include "filelink/source/chunk_source.h"

namespace filelink::source {

/// @brief Chunk source over files below a base directory.
///
/// Enforces the same call contract as the remote platform: every call must be aligned and
/// no longer than max_call_bytes, otherwise it is rejected with kInvalidArgument.
class FileChunkSource : public ChunkSource {
public:
    FileChunkSource(std::string base_path, SourceLimits limits);

    SourceLimits limits() const override { return limits_; }
    core::Result<std::string> Read(const ObjectHandle& handle, std::uint64_t offset,
                                   std::uint64_t length) override;

    const std::string& base_path() const { return base_path_; }

    /// @brief Relative path of safe segments (no traversal, no absolute paths).
    static bool IsSafeLocation(const std::string& location);

private:
    std::string base_path_;
    SourceLimits limits_;
};

}  // namespace filelink::source

#pragma once

#include <chrono>
#include <string>

#include "filelink/source/chunk_source.h"

namespace filelink::source {

/// @brief Chunk source that issues one HTTP `Range` GET per call against an upstream origin.
///
/// The object location is appended to the base URL. Each call carries its own socket timeout.
class HttpChunkSource : public ChunkSource {
public:
    HttpChunkSource(std::string base_url, SourceLimits limits, std::chrono::milliseconds timeout);

    SourceLimits limits() const override { return limits_; }
    core::Result<std::string> Read(const ObjectHandle& handle, std::uint64_t offset,
                                   std::uint64_t length) override;

private:
    std::string base_url_;
    SourceLimits limits_;
    std::chrono::milliseconds timeout_;
};

}  // namespace filelink::source

#include "filelink/source/chunk_source.h"

#include <chrono>
#include <stdexcept>

#include "filelink/source/file_chunk_source.h"
#include "filelink/source/http_chunk_source.h"

namespace filelink::source {

std::shared_ptr<ChunkSource> MakeChunkSource(const core::BackendConfig& config) {
    SourceLimits limits;
    limits.max_call_bytes = config.max_call_bytes;
    limits.alignment_bytes = config.alignment_bytes;
    if (config.type == "file") {
        return std::make_shared<FileChunkSource>(config.base_path, limits);
    }
    if (config.type == "http") {
        return std::make_shared<HttpChunkSource>(
            config.base_url, limits, std::chrono::milliseconds(config.request_timeout_ms));
    }
    throw std::invalid_argument("unknown backend.type: " + config.type);
}

}  // namespace filelink::source

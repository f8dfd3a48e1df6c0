#include "filelink/stream/chunk_plan.h"

#include <algorithm>

namespace filelink::stream {

ChunkPlan::ChunkPlan(ServingWindow window, std::uint64_t chunk_size)
    : window_(window), chunk_size_(chunk_size) {
    if (window_.empty() || chunk_size_ == 0) {
        return;
    }
    first_block_ = window_.start / chunk_size_;
    const auto last_block = (window_.end - 1) / chunk_size_;
    count_ = last_block - first_block_ + 1;
}

ChunkSpec ChunkPlan::At(std::uint64_t sequence) const {
    const auto block = first_block_ + sequence;
    const auto begin = std::max(window_.start, block * chunk_size_);
    const auto end = std::min(window_.end, (block + 1) * chunk_size_);
    return ChunkSpec{sequence, begin, end > begin ? end - begin : 0};
}

std::vector<BackendCall> PlanBackendCalls(const ChunkSpec& chunk,
                                          const source::SourceLimits& limits) {
    std::vector<BackendCall> calls;
    const auto align = std::max<std::uint64_t>(limits.alignment_bytes, 1);
    const auto max_call = std::max<std::uint64_t>(limits.max_call_bytes / align * align, align);
    const auto chunk_end = chunk.offset + chunk.length;

    auto cursor = chunk.offset;
    while (cursor < chunk_end) {
        const auto call_offset = cursor - cursor % align;
        const auto window_limit = call_offset - call_offset % max_call + max_call;
        const auto wanted_end = (chunk_end + align - 1) / align * align;
        const auto call_end = std::min(window_limit, wanted_end);

        BackendCall call;
        call.offset = call_offset;
        call.length = call_end - call_offset;
        call.skip = cursor - call_offset;
        call.take = std::min(chunk_end, call_end) - cursor;
        calls.push_back(call);
        cursor += call.take;
    }
    return calls;
}

}  // namespace filelink::stream

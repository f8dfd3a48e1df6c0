#include "filelink/stream/reorder_buffer.h"

#include <utility>

namespace filelink::stream {

ReorderBuffer::ReorderBuffer(std::size_t capacity) : capacity_(capacity) {}

bool ReorderBuffer::TryReserve() {
    if (reserved_ + ready_.size() >= capacity_) {
        return false;
    }
    ++reserved_;
    return true;
}

void ReorderBuffer::CancelReservation() {
    if (reserved_ > 0) {
        --reserved_;
    }
}

bool ReorderBuffer::Put(Chunk chunk) {
    CancelReservation();
    if (chunk.sequence < next_sequence_ || ready_.count(chunk.sequence) != 0) {
        return false;
    }
    const auto sequence = chunk.sequence;
    ready_.emplace(sequence, std::move(chunk));
    return true;
}

std::optional<Chunk> ReorderBuffer::PopReady() {
    auto it = ready_.find(next_sequence_);
    if (it == ready_.end()) {
        return std::nullopt;
    }
    Chunk chunk = std::move(it->second);
    ready_.erase(it);
    ++next_sequence_;
    return chunk;
}

}  // namespace filelink::stream

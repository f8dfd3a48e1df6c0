#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>

#include "filelink/stream/chunk.h"

namespace filelink::stream {

/// @brief Bounded holding area that releases chunks strictly in sequence order.
///
/// A producer must reserve a slot before fetching a chunk, so reserved plus buffered chunks
/// never exceed the capacity. Not thread-safe: the owning session serializes all calls.
class ReorderBuffer {
public:
    explicit ReorderBuffer(std::size_t capacity);

    /// @brief Claim a slot for a future Put(); false when the buffer is full.
    bool TryReserve();
    /// @brief Give back a reservation that will never be filled.
    void CancelReservation();
    /// @brief Store a fetched chunk into a reserved slot.
    ///
    /// Returns false (and frees the reservation) for a sequence already released or stored.
    bool Put(Chunk chunk);
    /// @brief Release the next chunk in sequence order, if it has arrived.
    std::optional<Chunk> PopReady();

    std::size_t capacity() const { return capacity_; }
    std::size_t reserved() const { return reserved_; }
    std::size_t buffered() const { return ready_.size(); }
    std::size_t available() const { return capacity_ - reserved_ - ready_.size(); }
    std::uint64_t next_sequence() const { return next_sequence_; }

private:
    std::size_t capacity_;
    std::size_t reserved_{0};
    std::uint64_t next_sequence_{0};
    std::map<std::uint64_t, Chunk> ready_;
};

}  // namespace filelink::stream

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "filelink/core/error.h"

namespace filelink::stream {

/// @brief Byte window [start, end) of an object served by one response.
struct ServingWindow {
    std::uint64_t start{0};
    std::uint64_t end{0};

    std::uint64_t length() const { return end - start; }
    bool empty() const { return end <= start; }
};

/// @brief One logical unit of a serving window, fetched and released in sequence order.
///
/// A chunk carrying an error is the terminal marker of a failed stream: nothing follows it.
struct Chunk {
    std::uint64_t sequence{0};
    std::uint64_t offset{0};
    std::string bytes;
    std::optional<core::Error> error;
    bool last{false};

    bool ok() const { return !error.has_value(); }
};

}  // namespace filelink::stream

#include "filelink/stream/range_resolver.h"

#include <cctype>
#include <algorithm>
#include <optional>

namespace filelink::stream {

namespace {

core::Error Unsatisfiable(const std::string& message) {
    return core::Error{core::ErrorCode::kRangeNotSatisfiable, message};
}

std::string Trim(const std::string& value) {
    std::size_t begin = 0;
    std::size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(begin, end - begin);
}

std::optional<std::uint64_t> ParseOffset(const std::string& digits) {
    if (digits.empty() || digits.size() > 19) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        value = value * 10 + static_cast<std::uint64_t>(c - '0');
    }
    return value;
}

bool HasBytesUnit(const std::string& header, std::size_t* spec_begin) {
    static const std::string kUnit = "bytes";
    if (header.size() < kUnit.size() + 1) {
        return false;
    }
    for (std::size_t i = 0; i < kUnit.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(header[i])) != kUnit[i]) {
            return false;
        }
    }
    std::size_t pos = kUnit.size();
    while (pos < header.size() && header[pos] == ' ') {
        ++pos;
    }
    if (pos >= header.size() || header[pos] != '=') {
        return false;
    }
    *spec_begin = pos + 1;
    return true;
}

}  // namespace

core::Result<RangeResolution> ResolveRange(const std::string& header, std::uint64_t object_size) {
    const auto value = Trim(header);
    if (value.empty()) {
        return RangeResolution{ServingWindow{0, object_size}, false};
    }

    std::size_t spec_begin = 0;
    if (!HasBytesUnit(value, &spec_begin)) {
        return Unsatisfiable("unsupported range unit");
    }
    const auto spec = Trim(value.substr(spec_begin));
    // Multi-range responses are not produced; reject rather than serve only the first range.
    if (spec.find(',') != std::string::npos) {
        return Unsatisfiable("multiple ranges are not supported");
    }
    const auto dash = spec.find('-');
    if (dash == std::string::npos) {
        return Unsatisfiable("malformed range");
    }
    const auto first = Trim(spec.substr(0, dash));
    const auto last = Trim(spec.substr(dash + 1));

    if (first.empty()) {
        const auto suffix = ParseOffset(last);
        if (!suffix || *suffix == 0 || object_size == 0) {
            return Unsatisfiable("invalid suffix range");
        }
        const auto length = std::min(*suffix, object_size);
        return RangeResolution{ServingWindow{object_size - length, object_size}, true};
    }

    const auto start = ParseOffset(first);
    if (!start) {
        return Unsatisfiable("malformed range start");
    }
    if (*start >= object_size) {
        return Unsatisfiable("range start beyond object size");
    }

    std::uint64_t end_inclusive = object_size - 1;
    if (!last.empty()) {
        const auto end = ParseOffset(last);
        if (!end) {
            return Unsatisfiable("malformed range end");
        }
        if (*end < *start) {
            return Unsatisfiable("range end before start");
        }
        end_inclusive = std::min(*end, object_size - 1);
    }
    return RangeResolution{ServingWindow{*start, end_inclusive + 1}, true};
}

std::string ContentRangeValue(const ServingWindow& window, std::uint64_t object_size) {
    return "bytes " + std::to_string(window.start) + "-" + std::to_string(window.end - 1) + "/" +
           std::to_string(object_size);
}

std::string UnsatisfiedContentRangeValue(std::uint64_t object_size) {
    return "bytes */" + std::to_string(object_size);
}

}  // namespace filelink::stream

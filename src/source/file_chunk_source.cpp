#include "filelink/source/file_chunk_source.h"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

#ifndef _WIN32
#include <fcntl.h>
#include <unistd.h>
#endif

namespace filelink::source {

namespace {

bool IsSafeSegment(const std::string& segment) {
    if (segment.empty() || segment.size() > 255 || segment == "." || segment == "..") {
        return false;
    }
    for (char c : segment) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.')) {
            return false;
        }
    }
    return true;
}

}  // namespace

FileChunkSource::FileChunkSource(std::string base_path, SourceLimits limits)
    : base_path_(std::move(base_path)), limits_(limits) {}

bool FileChunkSource::IsSafeLocation(const std::string& location) {
    if (location.empty() || location.front() == '/') {
        return false;
    }
    std::stringstream ss(location);
    std::string segment;
    while (std::getline(ss, segment, '/')) {
        if (!IsSafeSegment(segment)) {
            return false;
        }
    }
    return location.back() != '/';
}

core::Result<std::string> FileChunkSource::Read(const ObjectHandle& handle, std::uint64_t offset,
                                                std::uint64_t length) {
    if (length == 0 || length > limits_.max_call_bytes) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "read length " + std::to_string(length) + " exceeds call limit"};
    }
    if (offset % limits_.alignment_bytes != 0 || length % limits_.alignment_bytes != 0) {
        return core::Error{core::ErrorCode::kInvalidArgument, "unaligned read"};
    }
    if (!IsSafeLocation(handle.location())) {
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid object location"};
    }
    const auto path = (std::filesystem::path(base_path_) / handle.location()).string();

    std::string data(static_cast<std::size_t>(length), '\0');
#ifdef _WIN32
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return core::Error{core::ErrorCode::kNotFound, "object file missing"};
    }
    in.seekg(static_cast<std::streamoff>(offset));
    in.read(&data[0], static_cast<std::streamsize>(length));
    data.resize(static_cast<std::size_t>(in.gcount()));
#else
    const int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        return core::Error{core::ErrorCode::kNotFound, "object file missing"};
    }
    std::size_t total = 0;
    while (total < data.size()) {
        const ssize_t n = ::pread(fd, &data[total], data.size() - total,
                                  static_cast<off_t>(offset + total));
        if (n < 0) {
            ::close(fd);
            return core::Error{core::ErrorCode::kIoError, "failed to read object file"};
        }
        if (n == 0) {
            break;
        }
        total += static_cast<std::size_t>(n);
    }
    ::close(fd);
    data.resize(total);
#endif
    return data;
}

}  // namespace filelink::source

#include "filelink/registry/object_properties.h"

#include <cctype>
#include <unordered_map>

#include "filelink/core/time.h"

namespace filelink::registry {

namespace {

const std::unordered_map<std::string, std::string>& MediaKindExtensions() {
    static const std::unordered_map<std::string, std::string> kExtensions = {
        {"video", "mp4"}, {"audio", "mp3"},      {"voice", "ogg"},
        {"photo", "jpg"}, {"video_note", "mp4"},
    };
    return kExtensions;
}

const std::unordered_map<std::string, std::string>& MimeTypes() {
    static const std::unordered_map<std::string, std::string> kTypes = {
        {"mp4", "video/mp4"},        {"mkv", "video/x-matroska"}, {"webm", "video/webm"},
        {"mov", "video/quicktime"},  {"avi", "video/x-msvideo"},  {"mp3", "audio/mpeg"},
        {"ogg", "audio/ogg"},        {"oga", "audio/ogg"},        {"m4a", "audio/mp4"},
        {"flac", "audio/flac"},      {"wav", "audio/wav"},        {"jpg", "image/jpeg"},
        {"jpeg", "image/jpeg"},      {"png", "image/png"},        {"gif", "image/gif"},
        {"webp", "image/webp"},      {"pdf", "application/pdf"},  {"zip", "application/zip"},
        {"txt", "text/plain"},       {"json", "application/json"},
        {"apk", "application/vnd.android.package-archive"},
    };
    return kTypes;
}

}  // namespace

std::string GuessMimeType(const std::string& file_name) {
    const auto dot = file_name.rfind('.');
    if (dot == std::string::npos || dot + 1 >= file_name.size()) {
        return "application/octet-stream";
    }
    std::string extension = file_name.substr(dot + 1);
    for (auto& c : extension) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    const auto& types = MimeTypes();
    auto it = types.find(extension);
    if (it == types.end()) {
        return "application/octet-stream";
    }
    return it->second;
}

core::Result<DeclaredProperties> DeriveDeclaredProperties(const ObjectRecord& record) {
    DeclaredProperties properties;
    properties.file_name = record.file_name;
    if (properties.file_name.empty()) {
        const auto& extensions = MediaKindExtensions();
        auto it = extensions.find(record.media_kind);
        if (it == extensions.end()) {
            return core::Error{core::ErrorCode::kInvalidArgument, "Invalid media type."};
        }
        properties.file_name =
            record.media_kind + "-" + core::NowFormatted("%Y-%m-%d_%H-%M-%S") + "." + it->second;
    }
    properties.mime_type =
        record.mime_type.empty() ? GuessMimeType(properties.file_name) : record.mime_type;
    return properties;
}

}  // namespace filelink::registry

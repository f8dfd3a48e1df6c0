#include "filelink/http/access_request.h"

#include <cctype>
#include <sstream>

#include <Poco/Exception.h>
#include <Poco/URI.h>

namespace filelink::http {

namespace {

constexpr char kLegacyStreamSuffix[] = "=stream";

std::string DecodeComponent(const std::string& value) {
    std::string plus_as_space = value;
    for (auto& c : plus_as_space) {
        if (c == '+') {
            c = ' ';
        }
    }
    std::string decoded;
    try {
        Poco::URI::decode(plus_as_space, decoded);
    } catch (const Poco::Exception&) {
        return value;
    }
    return decoded;
}

bool EndsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

std::string StripQuery(const std::string& target) {
    auto pos = target.find('?');
    if (pos == std::string::npos) {
        return target;
    }
    return target.substr(0, pos);
}

std::string EncodeQueryValue(const std::string& value) {
    std::string encoded;
    Poco::URI::encode(value, "!#$&'()*+,/:;=?@[]", encoded);
    return encoded;
}

std::string GetQueryParam(const std::string& target, const std::string& key) {
    auto pos = target.find('?');
    if (pos == std::string::npos) {
        return "";
    }
    auto query = target.substr(pos + 1);
    std::stringstream ss(query);
    std::string item;
    while (std::getline(ss, item, '&')) {
        auto eq = item.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        if (item.substr(0, eq) == key) {
            return DecodeComponent(item.substr(eq + 1));
        }
    }
    return "";
}

core::Result<AccessRequest> ParseAccessRequest(const std::string& id_segment,
                                               const std::string& target,
                                               DisplayMode default_mode) {
    if (id_segment.empty() || id_segment.size() > 18) {
        return core::Error{core::ErrorCode::kInvalidArgument, "Invalid request."};
    }
    std::int64_t object_id = 0;
    for (char c : id_segment) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return core::Error{core::ErrorCode::kInvalidArgument, "Invalid request."};
        }
        object_id = object_id * 10 + (c - '0');
    }
    if (object_id <= 0) {
        return core::Error{core::ErrorCode::kInvalidArgument, "Invalid request."};
    }

    AccessRequest request;
    request.object_id = object_id;
    request.mode = default_mode;
    request.code = GetQueryParam(target, "code");

    if (EndsWith(request.code, kLegacyStreamSuffix)) {
        request.code.resize(request.code.size() - (sizeof(kLegacyStreamSuffix) - 1));
        request.mode = DisplayMode::kPlayer;
    }
    if (request.code.empty()) {
        return core::Error{core::ErrorCode::kUnauthorized,
                           "File code is required to download the file."};
    }

    const auto mode = GetQueryParam(target, "mode");
    if (mode == "player" || mode == "stream") {
        request.mode = DisplayMode::kPlayer;
    } else if (mode == "download") {
        request.mode = DisplayMode::kDownload;
    }
    return request;
}

}  // namespace filelink::http

#include "filelink/http/player_page.h"

#include <cstdio>

namespace filelink::http {

namespace {

std::string MediaElement(const std::string& mime_type) {
    if (mime_type.rfind("audio/", 0) == 0) {
        return "audio";
    }
    return "video";
}

std::string FormatMegabytes(std::uint64_t size_bytes) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.2f MB",
                  static_cast<double>(size_bytes) / (1024.0 * 1024.0));
    return buffer;
}

std::string FirstListValue(std::string value) {
    // Proxies may append; the first entry is the client-facing one.
    auto comma = value.find(',');
    if (comma != std::string::npos) {
        value.resize(comma);
    }
    const auto first = value.find_first_not_of(' ');
    const auto last = value.find_last_not_of(' ');
    if (first == std::string::npos) {
        return "";
    }
    return value.substr(first, last - first + 1);
}

}  // namespace

std::string EscapeHtml(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '&':
                out += "&amp;";
                break;
            case '<':
                out += "&lt;";
                break;
            case '>':
                out += "&gt;";
                break;
            case '"':
                out += "&quot;";
                break;
            case '\'':
                out += "&#39;";
                break;
            default:
                out += c;
                break;
        }
    }
    return out;
}

std::string RenderPlayerPage(const PlayerPageContext& context) {
    const auto name = EscapeHtml(context.file_name);
    const auto url = EscapeHtml(context.media_url);
    const auto mime = EscapeHtml(context.mime_type);
    const auto element = MediaElement(context.mime_type);

    std::string page;
    page += "<!DOCTYPE html>\n<html lang=\"en\">\n<head>\n";
    page += "<meta charset=\"utf-8\">\n";
    page += "<meta name=\"viewport\" content=\"width=device-width, initial-scale=1\">\n";
    page += "<title>" + name + "</title>\n";
    page += "<style>body{font-family:sans-serif;margin:2em auto;max-width:960px;}"
            "video,audio{width:100%;}</style>\n";
    page += "</head>\n<body>\n";
    page += "<h1>" + name + "</h1>\n";
    page += "<p>Size: " + FormatMegabytes(context.size_bytes) + "</p>\n";
    page += "<" + element + " controls preload=\"metadata\">\n";
    page += "<source src=\"" + url + "\" type=\"" + mime + "\">\n";
    page += "</" + element + ">\n";
    page += "<p><a href=\"" + url + "\">Download</a></p>\n";
    page += "</body>\n</html>\n";
    return page;
}

std::string RequestBaseUrl(const HttpRequest& request, const std::string& public_base_url,
                           bool tls) {
    if (!public_base_url.empty()) {
        auto base = public_base_url;
        while (!base.empty() && base.back() == '/') {
            base.pop_back();
        }
        return base;
    }

    std::string scheme = tls ? "https" : "http";
    auto proto = request.find("X-Forwarded-Proto");
    if (proto != request.end()) {
        auto value = FirstListValue(std::string(proto->value()));
        if (value == "http" || value == "https") {
            scheme = value;
        }
    }

    std::string host;
    auto forwarded_host = request.find("X-Forwarded-Host");
    if (forwarded_host != request.end()) {
        host = FirstListValue(std::string(forwarded_host->value()));
    }
    if (host.empty()) {
        host = std::string(request[boost::beast::http::field::host]);
    }
    if (host.empty()) {
        host = "localhost";
    }
    return scheme + "://" + host;
}

}  // namespace filelink::http

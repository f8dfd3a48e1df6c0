#pragma once

#include <cstdint>
#include <string>

#include "filelink/http/router.h"

namespace filelink::http {

/// @brief Inputs of the player page for one validated object.
struct PlayerPageContext {
    std::string file_name;
    std::uint64_t size_bytes{0};
    std::string mime_type;
    /// Absolute download URL used as the media source.
    std::string media_url;
};

/// @brief Render the minimal HTML player; every interpolated value is HTML-escaped.
std::string RenderPlayerPage(const PlayerPageContext& context);

/// @brief Base URL (`scheme://host`) for links handed back to the client.
///
/// A configured public base URL wins; otherwise X-Forwarded-Proto/X-Forwarded-Host and then
/// the Host header are used.
std::string RequestBaseUrl(const HttpRequest& request, const std::string& public_base_url,
                           bool tls);

std::string EscapeHtml(const std::string& value);

}  // namespace filelink::http

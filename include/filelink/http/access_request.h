#pragma once

#include <cstdint>
#include <string>

#include "filelink/core/result.h"

namespace filelink::http {

/// @brief What the client wants for a validated object reference.
enum class DisplayMode {
    kDownload,
    kPlayer,
};

/// @brief Object reference and access code extracted from an object URL.
struct AccessRequest {
    std::int64_t object_id{0};
    std::string code;
    DisplayMode mode{DisplayMode::kDownload};
};

/// @brief Parse `/{route}/{objectId}?code=...[&mode=player]`.
///
/// The id must be a positive decimal integer (kInvalidArgument otherwise) and the code must
/// be present and non-empty (kUnauthorized otherwise). A `mode` of `player` or `stream`
/// selects the player page. Legacy links append a literal `=stream` to the code value; the
/// suffix is stripped here and turned into the player mode, so only the bare code reaches
/// the registry.
core::Result<AccessRequest> ParseAccessRequest(const std::string& id_segment,
                                               const std::string& target,
                                               DisplayMode default_mode);

/// @brief Value of a query parameter, percent-decoded; empty when absent.
std::string GetQueryParam(const std::string& target, const std::string& key);
/// @brief Percent-encode a value for use inside a query string.
std::string EncodeQueryValue(const std::string& value);
/// @brief Path component of a request target.
std::string StripQuery(const std::string& target);

}  // namespace filelink::http

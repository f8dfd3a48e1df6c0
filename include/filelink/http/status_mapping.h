#pragma once

#include <string>

#include <boost/beast/http/status.hpp>

#include "filelink/core/error.h"
#include "filelink/http/router.h"

namespace filelink::http {

/// @brief HTTP status a module error surfaces as before any body byte is sent.
boost::beast::http::status StatusFor(core::ErrorCode code);

/// @brief Client-facing message for a status when the error carries none.
std::string DefaultMessage(boost::beast::http::status status);

HttpResponse JsonResponse(boost::beast::http::status status, unsigned version,
                          const std::string& body);
/// @brief Consistent JSON error envelope: {"error":{"code","message","request_id"}}.
HttpResponse ErrorResponse(boost::beast::http::status status, unsigned version,
                           const std::string& code, const std::string& message,
                           const std::string& request_id);
HttpResponse ErrorResponseFor(const core::Error& error, unsigned version,
                              const std::string& request_id);

}  // namespace filelink::http

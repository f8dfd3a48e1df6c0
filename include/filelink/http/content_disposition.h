#pragma once

#include <string>

namespace filelink::http {

/// @brief `attachment; filename*=UTF-8''<name>` for a download response.
///
/// The name is percent-encoded as UTF-8 so the header stays a single valid ext-value.
std::string AttachmentDisposition(const std::string& file_name);

}  // namespace filelink::http

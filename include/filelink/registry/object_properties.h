#pragma once

#include <string>

#include "filelink/core/result.h"
#include "filelink/registry/object_registry.h"

namespace filelink::registry {

/// @brief Name and MIME type presented to clients for an object.
struct DeclaredProperties {
    std::string file_name;
    std::string mime_type;
};

/// @brief Fill in a missing file name from the media kind and a missing MIME type from the
/// extension. Records with neither a name nor a known media kind are kInvalidArgument.
core::Result<DeclaredProperties> DeriveDeclaredProperties(const ObjectRecord& record);

/// @brief MIME type for a file name's extension, `application/octet-stream` when unknown.
std::string GuessMimeType(const std::string& file_name);

}  // namespace filelink::registry

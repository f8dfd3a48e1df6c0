#pragma once

#include <cstdint>
#include <string>

#include "filelink/core/error.h"
#include "filelink/core/result.h"
#include "filelink/source/chunk_source.h"

namespace filelink::registry {

/// @brief Stored record of one linked object.
struct ObjectRecord {
    std::int64_t object_id{0};
    /// Access code stored alongside the object; requests must present it verbatim.
    std::string label;
    std::int64_t source_object_id{0};
    std::int64_t issuer_id{0};
    std::string file_name;
    std::uint64_t size_bytes{0};
    std::string mime_type;
    std::string media_kind;
    std::string location;
    std::string created_at;
};

/// @brief Result of a successful resolve: a fresh handle plus the response metadata.
struct ResolvedObject {
    source::ObjectHandle handle;
    std::uint64_t size_bytes{0};
    std::string file_name;
    std::string mime_type;
};

/// @brief Input of the link-issuing boundary.
struct LinkRequest {
    std::int64_t source_object_id{0};
    std::int64_t issuer_id{0};
    std::string file_name;
    std::uint64_t size_bytes{0};
    std::string mime_type;
    std::string media_kind;
    std::string location;
};

/// @brief Maps public object ids and access codes to chunk source handles.
///
/// Implementations choose how records are looked up; callers only rely on Resolve() being a
/// single blocking call. Errors: kNotFound (no record), kForbidden (code mismatch),
/// kInvalidArgument (record cannot be served), kUnavailable (backing store failure).
class ObjectRegistry {
public:
    virtual ~ObjectRegistry() = default;

    virtual core::Result<ResolvedObject> Resolve(std::int64_t object_id,
                                                 const std::string& code) = 0;
    /// @brief Return the record for the request's access code, creating it if absent.
    virtual core::Result<ObjectRecord> GetOrCreateLink(const LinkRequest& request) = 0;
};

/// @brief Access code bound to one object: `<sourceObjectId>-<issuerId>`.
std::string MakeAccessCode(std::int64_t source_object_id, std::int64_t issuer_id);

}  // namespace filelink::registry

#include "filelink/registry/sqlite_object_registry.h"

#include <Poco/Data/SQLite/Connector.h>
#include <Poco/Data/SessionFactory.h>
#include <Poco/Data/Statement.h>

#include "filelink/core/time.h"
#include "filelink/registry/object_properties.h"

namespace {
using namespace Poco::Data::Keywords;
}

namespace filelink::registry {

std::string MakeAccessCode(std::int64_t source_object_id, std::int64_t issuer_id) {
    return std::to_string(source_object_id) + "-" + std::to_string(issuer_id);
}

SqliteObjectRegistry::SqliteObjectRegistry(const std::string& db_path)
    : session_([](const std::string& path) {
          Poco::Data::SQLite::Connector::registerConnector();
          return Poco::Data::Session("SQLite", path);
      }(db_path)) {
    InitSchema();
}

void SqliteObjectRegistry::InitSchema() {
    session_ <<
            "CREATE TABLE IF NOT EXISTS objects ("
            "object_id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "label TEXT NOT NULL UNIQUE,"
            "source_object_id INTEGER NOT NULL,"
            "issuer_id INTEGER NOT NULL,"
            "file_name TEXT NOT NULL,"
            "size_bytes INTEGER NOT NULL,"
            "mime_type TEXT NOT NULL,"
            "media_kind TEXT NOT NULL,"
            "location TEXT NOT NULL,"
            "created_at TEXT NOT NULL"
            ")",
        now;
}

core::Result<ObjectRecord> SqliteObjectRegistry::FindById(std::int64_t object_id) {
    ObjectRecord record;
    Poco::Int64 id_value = object_id;
    Poco::Int64 source_value = 0;
    Poco::Int64 issuer_value = 0;
    Poco::Int64 found_id = 0;
    Poco::UInt64 size_value = 0;
    try {
        Poco::Data::Statement select(session_);
        select << "SELECT object_id, label, source_object_id, issuer_id, file_name, size_bytes, "
                  "mime_type, media_kind, location, created_at FROM objects WHERE object_id = ?",
            use(id_value), into(found_id), into(record.label), into(source_value),
            into(issuer_value), into(record.file_name), into(size_value), into(record.mime_type),
            into(record.media_kind), into(record.location), into(record.created_at), now;
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kUnavailable, ex.displayText()};
    }
    if (found_id == 0) {
        return core::Error{core::ErrorCode::kNotFound, "File not found."};
    }
    record.object_id = found_id;
    record.source_object_id = source_value;
    record.issuer_id = issuer_value;
    record.size_bytes = size_value;
    return record;
}

core::Result<ObjectRecord> SqliteObjectRegistry::FindByLabel(const std::string& label) {
    Poco::Int64 found_id = 0;
    std::string label_value = label;
    try {
        Poco::Data::Statement select(session_);
        select << "SELECT object_id FROM objects WHERE label = ?", use(label_value),
            into(found_id), now;
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kUnavailable, ex.displayText()};
    }
    if (found_id == 0) {
        return core::Error{core::ErrorCode::kNotFound, "no record for label"};
    }
    return FindById(found_id);
}

core::Result<ObjectRecord> SqliteObjectRegistry::GetRecord(std::int64_t object_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return FindById(object_id);
}

core::Result<ResolvedObject> SqliteObjectRegistry::Resolve(std::int64_t object_id,
                                                          const std::string& code) {
    ObjectRecord record;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto found = FindById(object_id);
        if (!found.ok()) {
            return found.error();
        }
        record = std::move(found.value());
    }

    if (record.label != code) {
        return core::Error{core::ErrorCode::kForbidden, "Invalid file code."};
    }
    auto properties = DeriveDeclaredProperties(record);
    if (!properties.ok()) {
        return properties.error();
    }
    return ResolvedObject{source::ObjectHandle(record.object_id, record.location,
                                               record.size_bytes),
                          record.size_bytes, properties.value().file_name,
                          properties.value().mime_type};
}

core::Result<ObjectRecord> SqliteObjectRegistry::GetOrCreateLink(const LinkRequest& request) {
    if (request.location.empty()) {
        return core::Error{core::ErrorCode::kInvalidArgument, "location is required"};
    }
    if (request.file_name.empty() && request.media_kind.empty()) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "file_name or media_kind is required"};
    }

    const auto label = MakeAccessCode(request.source_object_id, request.issuer_id);
    std::lock_guard<std::mutex> lock(mutex_);
    auto existing = FindByLabel(label);
    if (existing.ok()) {
        return existing;
    }
    if (existing.error().code != core::ErrorCode::kNotFound) {
        return existing.error();
    }

    try {
        std::string label_value = label;
        Poco::Int64 source_value = request.source_object_id;
        Poco::Int64 issuer_value = request.issuer_id;
        std::string name_value = request.file_name;
        Poco::UInt64 size_value = request.size_bytes;
        std::string mime_value = request.mime_type;
        std::string kind_value = request.media_kind;
        std::string location_value = request.location;
        std::string created_at = core::NowIso8601();
        session_ <<
                "INSERT INTO objects(label, source_object_id, issuer_id, file_name, size_bytes, "
                "mime_type, media_kind, location, created_at) VALUES(?, ?, ?, ?, ?, ?, ?, ?, ?)",
            use(label_value), use(source_value), use(issuer_value), use(name_value),
            use(size_value), use(mime_value), use(kind_value), use(location_value),
            use(created_at), now;
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kDbError, ex.displayText()};
    }
    return FindByLabel(label);
}

}  // namespace filelink::registry

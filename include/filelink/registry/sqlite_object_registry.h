#pragma once

#include <cstdint>
#include <mutex>
#include <string>

#include <Poco/Data/Session.h>

#include "filelink/registry/object_registry.h"

namespace filelink::registry {

/// @brief SQLite-backed registry; lookups go through the primary key and the unique label index.
class SqliteObjectRegistry : public ObjectRegistry {
public:
    explicit SqliteObjectRegistry(const std::string& db_path);

    core::Result<ResolvedObject> Resolve(std::int64_t object_id,
                                         const std::string& code) override;
    core::Result<ObjectRecord> GetOrCreateLink(const LinkRequest& request) override;

    core::Result<ObjectRecord> GetRecord(std::int64_t object_id);

private:
    void InitSchema();
    core::Result<ObjectRecord> FindById(std::int64_t object_id);
    core::Result<ObjectRecord> FindByLabel(const std::string& label);

    // Poco::Data sessions are not thread-safe; resolves arrive from several backend workers.
    std::mutex mutex_;
    Poco::Data::Session session_;
};

}  // namespace filelink::registry

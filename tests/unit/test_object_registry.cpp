#include <filesystem>
#include <fstream>
#include <string>

#include <gtest/gtest.h>
#include <Poco/UUIDGenerator.h>

#include "filelink/registry/object_properties.h"
#include "filelink/registry/sqlite_object_registry.h"
#include "filelink/source/file_chunk_source.h"

using filelink::core::ErrorCode;
using filelink::registry::LinkRequest;
using filelink::registry::ObjectRecord;
using filelink::registry::SqliteObjectRegistry;

namespace {

std::filesystem::path MakeTempPath(const std::string& suffix) {
    const auto name = "filelink_test_" + Poco::UUIDGenerator().createOne().toString() + suffix;
    return std::filesystem::temp_directory_path() / name;
}

LinkRequest MakeLink(std::int64_t source_id, std::int64_t issuer_id) {
    LinkRequest request;
    request.source_object_id = source_id;
    request.issuer_id = issuer_id;
    request.file_name = "holiday.mp4";
    request.size_bytes = 8192;
    request.mime_type = "video/mp4";
    request.media_kind = "video";
    request.location = "holiday.mp4";
    return request;
}

class ObjectRegistryTest : public ::testing::Test {
protected:
    void TearDown() override { std::filesystem::remove(db_path_); }

    std::filesystem::path db_path_ = MakeTempPath(".db");
};

}  // namespace

TEST_F(ObjectRegistryTest, GetOrCreateLinkIsIdempotent) {
    SqliteObjectRegistry registry(db_path_.string());

    auto first = registry.GetOrCreateLink(MakeLink(42, 7));
    ASSERT_TRUE(first.ok());
    EXPECT_GT(first.value().object_id, 0);
    EXPECT_EQ(first.value().label, "42-7");

    auto again = registry.GetOrCreateLink(MakeLink(42, 7));
    ASSERT_TRUE(again.ok());
    EXPECT_EQ(again.value().object_id, first.value().object_id);

    auto other = registry.GetOrCreateLink(MakeLink(42, 8));
    ASSERT_TRUE(other.ok());
    EXPECT_NE(other.value().object_id, first.value().object_id);
}

TEST_F(ObjectRegistryTest, StoresLinkMetadata) {
    SqliteObjectRegistry registry(db_path_.string());
    auto created = registry.GetOrCreateLink(MakeLink(11, 12));
    ASSERT_TRUE(created.ok());

    auto record = registry.GetRecord(created.value().object_id);
    ASSERT_TRUE(record.ok());
    EXPECT_EQ(record.value().source_object_id, 11);
    EXPECT_EQ(record.value().issuer_id, 12);
    EXPECT_EQ(record.value().media_kind, "video");
    EXPECT_EQ(record.value().location, "holiday.mp4");
    EXPECT_FALSE(record.value().created_at.empty());

    auto missing = registry.GetRecord(created.value().object_id + 100);
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.error().code, ErrorCode::kNotFound);
}

TEST_F(ObjectRegistryTest, ResolveWithMatchingCode) {
    SqliteObjectRegistry registry(db_path_.string());
    auto created = registry.GetOrCreateLink(MakeLink(1, 2));
    ASSERT_TRUE(created.ok());

    auto resolved = registry.Resolve(created.value().object_id, "1-2");
    ASSERT_TRUE(resolved.ok());
    EXPECT_EQ(resolved.value().size_bytes, 8192u);
    EXPECT_EQ(resolved.value().file_name, "holiday.mp4");
    EXPECT_EQ(resolved.value().mime_type, "video/mp4");
    EXPECT_EQ(resolved.value().handle.location(), "holiday.mp4");
    EXPECT_EQ(resolved.value().handle.object_id(), created.value().object_id);
}

TEST_F(ObjectRegistryTest, ResolveWithWrongCodeIsForbidden) {
    SqliteObjectRegistry registry(db_path_.string());
    auto created = registry.GetOrCreateLink(MakeLink(1, 2));
    ASSERT_TRUE(created.ok());

    auto resolved = registry.Resolve(created.value().object_id, "1-3");
    ASSERT_FALSE(resolved.ok());
    EXPECT_EQ(resolved.error().code, ErrorCode::kForbidden);
}

TEST_F(ObjectRegistryTest, ResolveUnknownIdIsNotFound) {
    SqliteObjectRegistry registry(db_path_.string());
    auto resolved = registry.Resolve(999, "1-2");
    ASSERT_FALSE(resolved.ok());
    EXPECT_EQ(resolved.error().code, ErrorCode::kNotFound);
}

TEST_F(ObjectRegistryTest, LinkWithoutNameOrKindIsRejected) {
    SqliteObjectRegistry registry(db_path_.string());
    auto request = MakeLink(5, 6);
    request.file_name.clear();
    request.media_kind.clear();
    auto created = registry.GetOrCreateLink(request);
    ASSERT_FALSE(created.ok());
    EXPECT_EQ(created.error().code, ErrorCode::kInvalidArgument);
}

TEST_F(ObjectRegistryTest, LinkWithoutLocationIsRejected) {
    SqliteObjectRegistry registry(db_path_.string());
    auto request = MakeLink(5, 6);
    request.location.clear();
    auto created = registry.GetOrCreateLink(request);
    ASSERT_FALSE(created.ok());
    EXPECT_EQ(created.error().code, ErrorCode::kInvalidArgument);
}

TEST_F(ObjectRegistryTest, NamelessRecordGetsSynthesizedName) {
    SqliteObjectRegistry registry(db_path_.string());
    auto request = MakeLink(9, 9);
    request.file_name.clear();
    request.mime_type.clear();
    request.media_kind = "voice";
    auto created = registry.GetOrCreateLink(request);
    ASSERT_TRUE(created.ok());

    auto resolved = registry.Resolve(created.value().object_id, "9-9");
    ASSERT_TRUE(resolved.ok());
    const auto& name = resolved.value().file_name;
    EXPECT_EQ(name.rfind("voice-", 0), 0u);
    EXPECT_EQ(name.substr(name.size() - 4), ".ogg");
    EXPECT_EQ(resolved.value().mime_type, "audio/ogg");
}

TEST_F(ObjectRegistryTest, RepeatedResolveReadsIdenticalBytes) {
    const auto base = MakeTempPath("_objects");
    std::filesystem::create_directories(base);
    std::string content(10000, '\0');
    for (std::size_t i = 0; i < content.size(); ++i) {
        content[i] = static_cast<char>(i % 97);
    }
    {
        std::ofstream out(base / "holiday.mp4", std::ios::binary);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
    }

    SqliteObjectRegistry registry(db_path_.string());
    auto request = MakeLink(3, 4);
    request.size_bytes = content.size();
    auto created = registry.GetOrCreateLink(request);
    ASSERT_TRUE(created.ok());

    filelink::source::FileChunkSource source(base.string(), {4096, 4096});
    auto first = registry.Resolve(created.value().object_id, "3-4");
    auto second = registry.Resolve(created.value().object_id, "3-4");
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());

    auto a = source.Read(first.value().handle, 4096, 4096);
    auto b = source.Read(second.value().handle, 4096, 4096);
    ASSERT_TRUE(a.ok());
    ASSERT_TRUE(b.ok());
    EXPECT_EQ(a.value(), b.value());
    EXPECT_EQ(a.value(), content.substr(4096, 4096));

    std::filesystem::remove_all(base);
}

TEST(ObjectProperties, UnknownKindWithoutNameIsInvalid) {
    ObjectRecord record;
    record.media_kind = "sticker";
    auto properties = filelink::registry::DeriveDeclaredProperties(record);
    ASSERT_FALSE(properties.ok());
    EXPECT_EQ(properties.error().code, ErrorCode::kInvalidArgument);
}

TEST(ObjectProperties, StoredMimeTypeWins) {
    ObjectRecord record;
    record.file_name = "clip.bin";
    record.mime_type = "video/webm";
    auto properties = filelink::registry::DeriveDeclaredProperties(record);
    ASSERT_TRUE(properties.ok());
    EXPECT_EQ(properties.value().file_name, "clip.bin");
    EXPECT_EQ(properties.value().mime_type, "video/webm");
}

TEST(ObjectProperties, GuessMimeType) {
    EXPECT_EQ(filelink::registry::GuessMimeType("Movie.MKV"), "video/x-matroska");
    EXPECT_EQ(filelink::registry::GuessMimeType("song.mp3"), "audio/mpeg");
    EXPECT_EQ(filelink::registry::GuessMimeType("archive"), "application/octet-stream");
    EXPECT_EQ(filelink::registry::GuessMimeType("blob.xyz"), "application/octet-stream");
}

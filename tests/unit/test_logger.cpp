#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <gtest/gtest.h>
#include <Poco/UUIDGenerator.h>

#include "filelink/core/logger.h"

namespace {

std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

class LoggerFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("filelink_log_" + Poco::UUIDGenerator().createOne().toString());
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        // Drops the file channel before the directory goes away.
        filelink::core::InitLogging("warning");
        std::filesystem::remove_all(dir_);
    }

    std::filesystem::path dir_;
};

}  // namespace

TEST_F(LoggerFileTest, WritesToConfiguredFile) {
    const auto path = dir_ / "filelink.log";
    filelink::core::InitLogging("information", path.string());

    filelink::core::LogInfo("file channel marker");
    filelink::core::LogDebug("below the configured level");

    const auto content = ReadFile(path);
    EXPECT_NE(content.find("[Information] file channel marker"), std::string::npos);
    EXPECT_EQ(content.find("below the configured level"), std::string::npos);
}

TEST_F(LoggerFileTest, StreamLinesReachFile) {
    const auto path = dir_ / "streams.log";
    filelink::core::InitLogging("information", path.string());

    filelink::core::StreamLogEntry entry;
    entry.request_id = "req-9";
    entry.object_id = 17;
    entry.window_end = 4096;
    entry.bytes_sent = 4096;
    entry.state = "completed";
    filelink::core::LogStream(entry);

    const auto content = ReadFile(path);
    EXPECT_NE(content.find("\"request_id\":\"req-9\""), std::string::npos);
    EXPECT_NE(content.find("\"state\":\"completed\""), std::string::npos);
}

TEST_F(LoggerFileTest, EmptyPathCreatesNoFile) {
    filelink::core::InitLogging("information", "");
    filelink::core::LogWarning("console only");
    EXPECT_TRUE(std::filesystem::is_empty(dir_));
}

#pragma once

#include <cstdint>
#include <string>

namespace filelink::core {

/// @brief Configure the "filelink" logger: console output, plus a rotating file when
/// `log_file` is non-empty.
void InitLogging(const std::string& level, const std::string& log_file = "");
void LogInfo(const std::string& message);
void LogWarning(const std::string& message);
void LogError(const std::string& message);
void LogDebug(const std::string& message);
/// @brief Log a structured JSON line for HTTP requests.
void LogRequest(const std::string& request_id,
                const std::string& method,
                const std::string& target,
                const std::string& remote,
                int status,
                long long latency_ms);

/// @brief Summary of one finished streaming session, logged as a JSON line.
struct StreamLogEntry {
    std::string request_id;
    std::int64_t object_id{0};
    std::uint64_t window_start{0};
    std::uint64_t window_end{0};
    std::uint64_t bytes_sent{0};
    std::string state;
    std::string reason;
    long long duration_ms{0};
};

void LogStream(const StreamLogEntry& entry);

}  // namespace filelink::core

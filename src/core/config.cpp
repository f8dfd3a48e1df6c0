#include "filelink/core/config.h"

#include <cctype>
#include <stdexcept>

#include <Poco/AutoPtr.h>
#include <Poco/Util/JSONConfiguration.h>

namespace filelink::core {

namespace {

bool IsBlank(const std::string& value) {
    for (char c : value) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

void RequirePositive(long long value, const char* key) {
    if (value <= 0) {
        throw std::invalid_argument(std::string(key) + " must be positive");
    }
}

}  // namespace

Config LoadConfig(const std::string& path) {
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg(
        new Poco::Util::JSONConfiguration(path));

    Config config;
    config.server.host = cfg->getString("server.host", "0.0.0.0");
    config.server.port = cfg->getInt("server.port", 8080);
    config.server.threads = cfg->getInt("server.threads", 4);
    config.server.tls.enabled = cfg->getBool("server.tls.enabled", false);
    config.server.tls.certificate = cfg->getString("server.tls.certificate", "");
    config.server.tls.private_key = cfg->getString("server.tls.private_key", "");
    config.server.limits.max_body_bytes =
        static_cast<std::uint64_t>(cfg->getInt64("server.limits.max_body_bytes", 1048576));

    config.stream.chunk_size_bytes =
        static_cast<std::uint64_t>(cfg->getInt64("stream.chunk_size_bytes", 4 * 1024 * 1024));
    config.stream.prefetch_width = cfg->getInt("stream.prefetch_width", 10);
    config.stream.buffer_capacity = cfg->getInt("stream.buffer_capacity", 50);
    config.stream.read_timeout_ms = cfg->getInt("stream.read_timeout_ms", 30000);
    config.stream.max_retries = cfg->getInt("stream.max_retries", 3);
    config.stream.retry_backoff_ms = cfg->getInt("stream.retry_backoff_ms", 250);
    config.stream.idle_timeout_seconds = cfg->getInt("stream.idle_timeout_seconds", 120);

    config.admission.max_sessions = cfg->getInt("admission.max_sessions", 100);

    config.backend.type = cfg->getString("backend.type", "file");
    config.backend.base_path = cfg->getString("backend.base_path", "data/objects");
    config.backend.base_url = cfg->getString("backend.base_url", "");
    config.backend.max_call_bytes =
        static_cast<std::uint64_t>(cfg->getInt64("backend.max_call_bytes", 1024 * 1024));
    config.backend.alignment_bytes =
        static_cast<std::uint64_t>(cfg->getInt64("backend.alignment_bytes", 4096));
    config.backend.threads = cfg->getInt("backend.threads", 16);
    config.backend.request_timeout_ms = cfg->getInt("backend.request_timeout_ms", 30000);

    config.registry.resolve_timeout_ms = cfg->getInt("registry.resolve_timeout_ms", 10000);

    config.links.enabled = cfg->getBool("links.enabled", false);
    config.links.admin_token = cfg->getString("links.admin_token", "");
    config.links.public_base_url = cfg->getString("links.public_base_url", "");

    config.observability.log_level = cfg->getString("observability.log_level", "information");
    config.observability.log_file = cfg->getString("observability.log_file", "");

    ValidateConfig(config);
    return config;
}

void ValidateConfig(const Config& config) {
    RequirePositive(config.server.threads, "server.threads");
    if (config.server.tls.enabled &&
        (IsBlank(config.server.tls.certificate) || IsBlank(config.server.tls.private_key))) {
        throw std::invalid_argument(
            "server.tls.enabled=true requires server.tls.certificate and server.tls.private_key");
    }

    RequirePositive(static_cast<long long>(config.stream.chunk_size_bytes),
                    "stream.chunk_size_bytes");
    RequirePositive(config.stream.prefetch_width, "stream.prefetch_width");
    RequirePositive(config.stream.buffer_capacity, "stream.buffer_capacity");
    RequirePositive(config.stream.read_timeout_ms, "stream.read_timeout_ms");
    RequirePositive(config.stream.retry_backoff_ms, "stream.retry_backoff_ms");
    RequirePositive(config.stream.idle_timeout_seconds, "stream.idle_timeout_seconds");
    if (config.stream.max_retries < 0) {
        throw std::invalid_argument("stream.max_retries must not be negative");
    }

    RequirePositive(config.admission.max_sessions, "admission.max_sessions");

    RequirePositive(static_cast<long long>(config.backend.alignment_bytes),
                    "backend.alignment_bytes");
    RequirePositive(static_cast<long long>(config.backend.max_call_bytes),
                    "backend.max_call_bytes");
    RequirePositive(config.backend.threads, "backend.threads");
    RequirePositive(config.backend.request_timeout_ms, "backend.request_timeout_ms");
    // Backend calls are planned on alignment boundaries; misaligned sizes would split calls.
    if (config.backend.max_call_bytes % config.backend.alignment_bytes != 0) {
        throw std::invalid_argument(
            "backend.max_call_bytes must be a multiple of backend.alignment_bytes");
    }
    if (config.stream.chunk_size_bytes % config.backend.alignment_bytes != 0) {
        throw std::invalid_argument(
            "stream.chunk_size_bytes must be a multiple of backend.alignment_bytes");
    }
    if (config.backend.type != "file" && config.backend.type != "http") {
        throw std::invalid_argument("backend.type must be \"file\" or \"http\"");
    }
    if (config.backend.type == "http" && IsBlank(config.backend.base_url)) {
        throw std::invalid_argument("backend.type=http requires non-empty backend.base_url");
    }

    RequirePositive(config.registry.resolve_timeout_ms, "registry.resolve_timeout_ms");

    if (config.links.enabled && IsBlank(config.links.admin_token)) {
        throw std::invalid_argument("links.enabled=true requires non-empty links.admin_token");
    }
}

std::string LoadDatabasePath(const std::string& path) {
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg(
        new Poco::Util::JSONConfiguration(path));
    return cfg->getString("sqlite.path", "data/registry.db");
}

}  // namespace filelink::core

#pragma once

#include <cstdint>
#include <string>

namespace filelink::core {

/// @brief TLS configuration for the HTTP server.
struct TlsConfig {
    bool enabled{false};
    std::string certificate;
    std::string private_key;
};

/// @brief Request/connection limits for the HTTP server.
struct LimitsConfig {
    std::uint64_t max_body_bytes{1048576};
};

/// @brief HTTP server configuration (bind address, TLS, limits).
struct ServerConfig {
    std::string host{"0.0.0.0"};
    int port{8080};
    int threads{4};
    TlsConfig tls;
    LimitsConfig limits;
};

/// @brief Tuning of the per-session chunk pipeline.
struct StreamConfig {
    std::uint64_t chunk_size_bytes{4 * 1024 * 1024};
    int prefetch_width{10};
    int buffer_capacity{50};
    int read_timeout_ms{30000};
    int max_retries{3};
    int retry_backoff_ms{250};
    int idle_timeout_seconds{120};
};

/// @brief Global admission ceiling for concurrent sessions.
struct AdmissionConfig {
    int max_sessions{100};
};

/// @brief Chunk source selection and the call limits it enforces.
struct BackendConfig {
    std::string type{"file"};
    std::string base_path{"data/objects"};
    std::string base_url;
    std::uint64_t max_call_bytes{1024 * 1024};
    std::uint64_t alignment_bytes{4096};
    int threads{16};
    int request_timeout_ms{30000};
};

struct RegistryConfig {
    int resolve_timeout_ms{10000};
};

/// @brief Link-issuing endpoint settings.
struct LinksConfig {
    bool enabled{false};
    /// Required when the endpoint is enabled.
    std::string admin_token;
    std::string public_base_url;
};

/// @brief Observability settings (logging).
struct ObservabilityConfig {
    std::string log_level{"information"};
    /// Rotating log file written next to the console; empty disables it.
    std::string log_file;
};

/// @brief Top-level configuration for FileLink.
struct Config {
    ServerConfig server;
    StreamConfig stream;
    AdmissionConfig admission;
    BackendConfig backend;
    RegistryConfig registry;
    LinksConfig links;
    ObservabilityConfig observability;
};

/// @brief Load server configuration from a JSON file.
Config LoadConfig(const std::string& path);
/// @brief Check cross-field constraints; throws std::invalid_argument on violation.
void ValidateConfig(const Config& config);
/// @brief Load SQLite registry DB path from a JSON file.
std::string LoadDatabasePath(const std::string& path);

}  // namespace filelink::core

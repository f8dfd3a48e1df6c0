#pragma once

#include <cstdint>
#include <string>

namespace filelink::observability {

/// @brief Render Prometheus-style metrics for a minimal `/metrics` endpoint.
std::string RenderMetrics();
/// @brief Record a completed HTTP request for metrics.
void RecordRequest(int status_code, long long latency_ms);

void RecordStreamStarted();
/// @brief Record a stream reaching a terminal state ("completed", "aborted" or "failed").
void RecordStreamFinished(const std::string& state, std::uint64_t bytes_sent);
void RecordAdmissionRejected();
void RecordBackendCall(bool ok);

}  // namespace filelink::observability

#include "filelink/observability/metrics.h"

#include <atomic>

namespace filelink::observability {
namespace {
std::atomic<std::uint64_t> g_total_requests{0};
std::atomic<std::uint64_t> g_requests_2xx{0};
std::atomic<std::uint64_t> g_requests_4xx{0};
std::atomic<std::uint64_t> g_requests_5xx{0};
std::atomic<std::uint64_t> g_latency_ms_total{0};

std::atomic<std::int64_t> g_streams_active{0};
std::atomic<std::uint64_t> g_streams_completed{0};
std::atomic<std::uint64_t> g_streams_aborted{0};
std::atomic<std::uint64_t> g_streams_failed{0};
std::atomic<std::uint64_t> g_stream_bytes_total{0};
std::atomic<std::uint64_t> g_admission_rejected{0};
std::atomic<std::uint64_t> g_backend_calls{0};
std::atomic<std::uint64_t> g_backend_failures{0};

std::string Counter(const std::string& name, const std::string& help, std::uint64_t value) {
    return "# HELP " + name + " " + help + "\n# TYPE " + name + " counter\n" + name + " " +
           std::to_string(value) + "\n";
}
}  // namespace

void RecordRequest(int status_code, long long latency_ms) {
    g_total_requests.fetch_add(1, std::memory_order_relaxed);
    g_latency_ms_total.fetch_add(static_cast<std::uint64_t>(latency_ms),
                                 std::memory_order_relaxed);
    if (status_code >= 200 && status_code < 300) {
        g_requests_2xx.fetch_add(1, std::memory_order_relaxed);
    } else if (status_code >= 400 && status_code < 500) {
        g_requests_4xx.fetch_add(1, std::memory_order_relaxed);
    } else if (status_code >= 500) {
        g_requests_5xx.fetch_add(1, std::memory_order_relaxed);
    }
}

void RecordStreamStarted() { g_streams_active.fetch_add(1, std::memory_order_relaxed); }

void RecordStreamFinished(const std::string& state, std::uint64_t bytes_sent) {
    g_streams_active.fetch_sub(1, std::memory_order_relaxed);
    g_stream_bytes_total.fetch_add(bytes_sent, std::memory_order_relaxed);
    if (state == "completed") {
        g_streams_completed.fetch_add(1, std::memory_order_relaxed);
    } else if (state == "aborted") {
        g_streams_aborted.fetch_add(1, std::memory_order_relaxed);
    } else {
        g_streams_failed.fetch_add(1, std::memory_order_relaxed);
    }
}

void RecordAdmissionRejected() { g_admission_rejected.fetch_add(1, std::memory_order_relaxed); }

void RecordBackendCall(bool ok) {
    g_backend_calls.fetch_add(1, std::memory_order_relaxed);
    if (!ok) {
        g_backend_failures.fetch_add(1, std::memory_order_relaxed);
    }
}

std::string RenderMetrics() {
    std::string out =
        "# HELP filelink_up 1 if server is up\n"
        "# TYPE filelink_up gauge\n"
        "filelink_up 1\n";
    out += Counter("filelink_http_requests_total", "Total HTTP requests processed",
                   g_total_requests.load(std::memory_order_relaxed));
    out += Counter("filelink_http_requests_2xx", "Total 2xx responses",
                   g_requests_2xx.load(std::memory_order_relaxed));
    out += Counter("filelink_http_requests_4xx", "Total 4xx responses",
                   g_requests_4xx.load(std::memory_order_relaxed));
    out += Counter("filelink_http_requests_5xx", "Total 5xx responses",
                   g_requests_5xx.load(std::memory_order_relaxed));
    out += Counter("filelink_http_request_latency_ms_sum", "Sum of request latencies in ms",
                   g_latency_ms_total.load(std::memory_order_relaxed));
    out += "# HELP filelink_streams_active Streams currently holding an admission slot\n"
           "# TYPE filelink_streams_active gauge\n"
           "filelink_streams_active " +
           std::to_string(g_streams_active.load(std::memory_order_relaxed)) + "\n";
    out += Counter("filelink_streams_completed_total", "Streams that sent every byte",
                   g_streams_completed.load(std::memory_order_relaxed));
    out += Counter("filelink_streams_aborted_total", "Streams ended by client disconnect",
                   g_streams_aborted.load(std::memory_order_relaxed));
    out += Counter("filelink_streams_failed_total", "Streams ended by backend failure or timeout",
                   g_streams_failed.load(std::memory_order_relaxed));
    out += Counter("filelink_stream_bytes_total", "Body bytes written by streams",
                   g_stream_bytes_total.load(std::memory_order_relaxed));
    out += Counter("filelink_admission_rejected_total", "Requests refused at the admission gate",
                   g_admission_rejected.load(std::memory_order_relaxed));
    out += Counter("filelink_backend_calls_total", "Chunk source calls issued",
                   g_backend_calls.load(std::memory_order_relaxed));
    out += Counter("filelink_backend_failures_total", "Chunk source calls that failed",
                   g_backend_failures.load(std::memory_order_relaxed));
    return out;
}

}  // namespace filelink::observability

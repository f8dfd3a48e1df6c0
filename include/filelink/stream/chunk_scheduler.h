#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>

#include "filelink/core/config.h"
#include "filelink/core/result.h"
#include "filelink/source/chunk_source.h"
#include "filelink/stream/chunk.h"
#include "filelink/stream/chunk_plan.h"
#include "filelink/stream/reorder_buffer.h"

namespace filelink::stream {

struct SchedulerOptions {
    std::uint64_t chunk_size{4 * 1024 * 1024};
    std::size_t prefetch_width{10};
    std::size_t buffer_capacity{50};
    std::chrono::milliseconds read_timeout{30000};
    int max_retries{3};
    std::chrono::milliseconds retry_backoff{250};
};

SchedulerOptions MakeSchedulerOptions(const core::StreamConfig& config);

/// @brief Prefetch pipeline that pulls one serving window from a ChunkSource.
///
/// Chunk fetches run on the backend executor; every other member is touched only on the
/// session executor (the connection strand), so Start(), NextChunk() and Cancel() must be
/// called there. At most `prefetch_width` fetches run at once and a fetch is only issued
/// after a reorder buffer slot has been reserved, so an idle consumer stalls the pipeline.
class ChunkScheduler : public std::enable_shared_from_this<ChunkScheduler> {
public:
    using Executor = boost::asio::any_io_executor;
    using ChunkHandler = std::function<void(Chunk)>;

    ChunkScheduler(Executor session_executor, Executor backend_executor,
                   std::shared_ptr<source::ChunkSource> source, source::ObjectHandle handle,
                   ServingWindow window, SchedulerOptions options);

    void Start();
    /// @brief Deliver the next in-order chunk to `handler` once it is available.
    ///
    /// The handler runs on the session executor. A chunk with an error is the last one
    /// delivered. Only one request may be outstanding at a time.
    void NextChunk(ChunkHandler handler);
    /// @brief Stop issuing fetches and drop in-flight ones; pending handlers are never run.
    void Cancel();

    std::uint64_t chunk_count() const { return plan_.count(); }
    std::size_t in_flight() const { return in_flight_.size(); }
    std::uint64_t backend_calls() const { return backend_calls_.load(std::memory_order_relaxed); }
    bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
    struct Fetch {
        int attempt{0};
        std::uint64_t token{0};
        std::unique_ptr<boost::asio::steady_timer> timer;
    };

    void Pump();
    void Issue(std::uint64_t sequence, int attempt);
    core::Result<std::string> FetchChunk(const ChunkSpec& spec);
    void OnFetched(std::uint64_t sequence, std::uint64_t token, core::Result<std::string> result);
    void OnTimeout(std::uint64_t sequence, std::uint64_t token);
    void OnAttemptFailed(std::uint64_t sequence, const core::Error& error);
    void FailAt(std::uint64_t sequence, const core::Error& error);
    void Deliver();

    Executor session_executor_;
    Executor backend_executor_;
    std::shared_ptr<source::ChunkSource> source_;
    const source::ObjectHandle handle_;
    const ChunkPlan plan_;
    const source::SourceLimits limits_;
    const SchedulerOptions options_;

    ReorderBuffer buffer_;
    std::unordered_map<std::uint64_t, Fetch> in_flight_;
    std::uint64_t next_issue_{0};
    std::uint64_t next_token_{0};
    std::optional<std::uint64_t> failed_at_;
    ChunkHandler handler_;

    std::atomic<bool> cancelled_{false};
    std::atomic<std::uint64_t> backend_calls_{0};
};

}  // namespace filelink::stream

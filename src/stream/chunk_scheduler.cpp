#include "filelink/stream/chunk_scheduler.h"

#include <algorithm>
#include <utility>

#include <boost/asio/post.hpp>

#include "filelink/core/logger.h"
#include "filelink/observability/metrics.h"

namespace filelink::stream {

namespace net = boost::asio;

SchedulerOptions MakeSchedulerOptions(const core::StreamConfig& config) {
    SchedulerOptions options;
    options.chunk_size = config.chunk_size_bytes;
    options.prefetch_width = static_cast<std::size_t>(config.prefetch_width);
    options.buffer_capacity = static_cast<std::size_t>(config.buffer_capacity);
    options.read_timeout = std::chrono::milliseconds(config.read_timeout_ms);
    options.max_retries = config.max_retries;
    options.retry_backoff = std::chrono::milliseconds(config.retry_backoff_ms);
    return options;
}

ChunkScheduler::ChunkScheduler(Executor session_executor, Executor backend_executor,
                               std::shared_ptr<source::ChunkSource> source,
                               source::ObjectHandle handle, ServingWindow window,
                               SchedulerOptions options)
    : session_executor_(std::move(session_executor)),
      backend_executor_(std::move(backend_executor)),
      source_(std::move(source)),
      handle_(std::move(handle)),
      plan_(window, options.chunk_size),
      limits_(source_->limits()),
      options_(options),
      buffer_(std::max<std::size_t>(options.buffer_capacity, 1)) {}

void ChunkScheduler::Start() { Pump(); }

void ChunkScheduler::NextChunk(ChunkHandler handler) {
    if (cancelled()) {
        return;
    }
    handler_ = std::move(handler);
    Deliver();
}

void ChunkScheduler::Cancel() {
    cancelled_.store(true, std::memory_order_release);
    for (auto& entry : in_flight_) {
        entry.second.timer->cancel();
    }
    in_flight_.clear();
    handler_ = nullptr;
}

void ChunkScheduler::Pump() {
    if (cancelled() || failed_at_) {
        return;
    }
    const auto width = std::max<std::size_t>(options_.prefetch_width, 1);
    while (next_issue_ < plan_.count() && in_flight_.size() < width && buffer_.TryReserve()) {
        Issue(next_issue_++, 0);
    }
}

void ChunkScheduler::Issue(std::uint64_t sequence, int attempt) {
    auto& fetch = in_flight_[sequence];
    fetch.attempt = attempt;
    fetch.token = ++next_token_;
    if (!fetch.timer) {
        fetch.timer = std::make_unique<net::steady_timer>(session_executor_);
    }

    auto self = shared_from_this();
    const auto token = fetch.token;
    fetch.timer->expires_after(options_.read_timeout);
    fetch.timer->async_wait([self, sequence, token](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        self->OnTimeout(sequence, token);
    });

    const auto spec = plan_.At(sequence);
    net::post(backend_executor_, [self, sequence, token, spec]() {
        auto result = self->FetchChunk(spec);
        net::post(self->session_executor_,
                  [self, sequence, token, result = std::move(result)]() mutable {
                      self->OnFetched(sequence, token, std::move(result));
                  });
    });
}

core::Result<std::string> ChunkScheduler::FetchChunk(const ChunkSpec& spec) {
    // Runs on a backend worker: only immutable members and atomics are touched here.
    std::string data;
    data.reserve(static_cast<std::size_t>(spec.length));
    for (const auto& call : PlanBackendCalls(spec, limits_)) {
        if (cancelled()) {
            return core::Error{core::ErrorCode::kCancelled, "stream cancelled"};
        }
        auto result = source_->Read(handle_, call.offset, call.length);
        backend_calls_.fetch_add(1, std::memory_order_relaxed);
        observability::RecordBackendCall(result.ok());
        if (!result.ok()) {
            return result.error();
        }
        const auto& bytes = result.value();
        if (bytes.size() < call.skip + call.take) {
            return core::Error{core::ErrorCode::kIoError,
                               "short read at offset " + std::to_string(call.offset) + ": got " +
                                   std::to_string(bytes.size()) + " bytes"};
        }
        data.append(bytes, static_cast<std::size_t>(call.skip),
                    static_cast<std::size_t>(call.take));
    }
    return data;
}

void ChunkScheduler::OnFetched(std::uint64_t sequence, std::uint64_t token,
                               core::Result<std::string> result) {
    if (cancelled()) {
        return;
    }
    auto it = in_flight_.find(sequence);
    if (it == in_flight_.end() || it->second.token != token) {
        // Completion of an attempt that already timed out or was dropped.
        return;
    }
    it->second.timer->cancel();
    if (!result.ok()) {
        return OnAttemptFailed(sequence, result.error());
    }
    in_flight_.erase(it);

    const auto spec = plan_.At(sequence);
    Chunk chunk;
    chunk.sequence = sequence;
    chunk.offset = spec.offset;
    chunk.bytes = std::move(result.value());
    chunk.last = sequence + 1 == plan_.count();
    buffer_.Put(std::move(chunk));
    Deliver();
    Pump();
}

void ChunkScheduler::OnTimeout(std::uint64_t sequence, std::uint64_t token) {
    if (cancelled()) {
        return;
    }
    auto it = in_flight_.find(sequence);
    if (it == in_flight_.end() || it->second.token != token) {
        return;
    }
    OnAttemptFailed(sequence, core::Error{core::ErrorCode::kTimeout, "backend read timed out"});
}

void ChunkScheduler::OnAttemptFailed(std::uint64_t sequence, const core::Error& error) {
    auto& fetch = in_flight_[sequence];
    if (fetch.attempt >= options_.max_retries) {
        return FailAt(sequence, error);
    }

    const auto attempt = fetch.attempt;
    const auto backoff = options_.retry_backoff * (1LL << std::min(attempt, 16));
    core::LogWarning("chunk fetch failed for object " + std::to_string(handle_.object_id()) +
                     " chunk " + std::to_string(sequence) + " (attempt " +
                     std::to_string(attempt + 1) + "): " + error.message + "; retrying in " +
                     std::to_string(backoff.count()) + "ms");

    // A fresh token invalidates the failed attempt until the retry is issued.
    fetch.token = ++next_token_;
    const auto token = fetch.token;
    auto self = shared_from_this();
    fetch.timer->expires_after(backoff);
    fetch.timer->async_wait(
        [self, sequence, token, attempt](const boost::system::error_code& ec) {
            if (ec || self->cancelled()) {
                return;
            }
            auto it = self->in_flight_.find(sequence);
            if (it == self->in_flight_.end() || it->second.token != token) {
                return;
            }
            self->Issue(sequence, attempt + 1);
        });
}

void ChunkScheduler::FailAt(std::uint64_t sequence, const core::Error& error) {
    core::LogError("chunk fetch for object " + std::to_string(handle_.object_id()) + " chunk " +
                   std::to_string(sequence) + " failed permanently: " + error.message);
    if (failed_at_ && *failed_at_ <= sequence) {
        in_flight_.erase(sequence);
        buffer_.CancelReservation();
        return;
    }
    failed_at_ = sequence;

    // Nothing past the failed chunk will ever be written; drop those fetches now.
    for (auto it = in_flight_.begin(); it != in_flight_.end();) {
        if (it->first > sequence) {
            it->second.timer->cancel();
            buffer_.CancelReservation();
            it = in_flight_.erase(it);
        } else {
            ++it;
        }
    }
    auto it = in_flight_.find(sequence);
    if (it != in_flight_.end()) {
        it->second.timer->cancel();
        in_flight_.erase(it);
    }

    Chunk marker;
    marker.sequence = sequence;
    marker.offset = plan_.At(sequence).offset;
    marker.error = core::Error{core::ErrorCode::kIoError, error.message};
    marker.last = true;
    buffer_.Put(std::move(marker));
    Deliver();
}

void ChunkScheduler::Deliver() {
    if (!handler_) {
        return;
    }
    auto chunk = buffer_.PopReady();
    if (!chunk) {
        return;
    }
    auto handler = std::move(handler_);
    handler_ = nullptr;
    net::post(session_executor_, [handler = std::move(handler), chunk = std::move(*chunk)]() mutable {
        handler(std::move(chunk));
    });
    Pump();
}

}  // namespace filelink::stream

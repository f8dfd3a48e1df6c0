#include "filelink/stream/stream_session.h"

#include <utility>

#include "filelink/core/logger.h"
#include "filelink/observability/metrics.h"
#include "filelink/stream/chunk_scheduler.h"

namespace filelink::stream {

const char* StreamStateName(StreamState state) {
    switch (state) {
        case StreamState::kAdmitted:
            return "admitted";
        case StreamState::kResolving:
            return "resolving";
        case StreamState::kWindowing:
            return "windowing";
        case StreamState::kStreaming:
            return "streaming";
        case StreamState::kCompleted:
            return "completed";
        case StreamState::kAborted:
            return "aborted";
        case StreamState::kFailed:
            return "failed";
    }
    return "unknown";
}

bool IsTerminal(StreamState state) {
    return state == StreamState::kCompleted || state == StreamState::kAborted ||
           state == StreamState::kFailed;
}

StreamSession::StreamSession(std::string request_id, AdmissionSlot slot)
    : request_id_(std::move(request_id)),
      slot_(std::move(slot)),
      started_(std::chrono::steady_clock::now()) {}

StreamSession::~StreamSession() {
    if (!terminal()) {
        Abort("session destroyed");
    }
}

core::Result<void> StreamSession::Advance(StreamState next) {
    bool allowed = false;
    switch (next) {
        case StreamState::kResolving:
            allowed = state_ == StreamState::kAdmitted;
            break;
        case StreamState::kWindowing:
            allowed = state_ == StreamState::kResolving;
            break;
        case StreamState::kStreaming:
            allowed = state_ == StreamState::kWindowing;
            break;
        default:
            allowed = false;
            break;
    }
    if (!allowed) {
        return core::Error{core::ErrorCode::kInternal,
                           std::string("illegal stream transition ") + StreamStateName(state_) +
                               " -> " + StreamStateName(next)};
    }
    state_ = next;
    if (next == StreamState::kStreaming) {
        streamed_ = true;
        observability::RecordStreamStarted();
    }
    return core::Ok();
}

void StreamSession::AttachScheduler(std::shared_ptr<ChunkScheduler> scheduler) {
    scheduler_ = std::move(scheduler);
}

void StreamSession::Complete() {
    if (state_ != StreamState::kStreaming) {
        return Fail("completed outside streaming state");
    }
    Finish(StreamState::kCompleted, "");
}

void StreamSession::Abort(const std::string& reason) { Finish(StreamState::kAborted, reason); }

void StreamSession::Fail(const std::string& reason) { Finish(StreamState::kFailed, reason); }

void StreamSession::Finish(StreamState terminal_state, const std::string& reason) {
    if (terminal()) {
        return;
    }
    state_ = terminal_state;
    reason_ = reason;
    if (scheduler_) {
        scheduler_->Cancel();
    }
    slot_.Release();

    // Only sessions that reached Streaming count as streams.
    if (!streamed_) {
        return;
    }
    observability::RecordStreamFinished(StreamStateName(terminal_state), bytes_sent_);
    core::StreamLogEntry entry;
    entry.request_id = request_id_;
    entry.object_id = object_id_;
    entry.window_start = window_.start;
    entry.window_end = window_.end;
    entry.bytes_sent = bytes_sent_;
    entry.state = StreamStateName(terminal_state);
    entry.reason = reason;
    entry.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::steady_clock::now() - started_)
                            .count();
    core::LogStream(entry);
}

}  // namespace filelink::stream

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "filelink/core/result.h"
#include "filelink/stream/admission.h"
#include "filelink/stream/chunk.h"

namespace filelink::stream {

class ChunkScheduler;

enum class StreamState {
    kAdmitted,
    kResolving,
    kWindowing,
    kStreaming,
    kCompleted,
    kAborted,
    kFailed,
};

const char* StreamStateName(StreamState state);
bool IsTerminal(StreamState state);

/// @brief Lifecycle of one streaming request: owns the admission slot and the scheduler.
///
/// Admitted -> Resolving -> Windowing -> Streaming -> {Completed | Aborted | Failed}; any
/// non-terminal state may fail. Reaching a terminal state cancels the scheduler, releases
/// the slot exactly once, and emits the stream log line.
class StreamSession {
public:
    StreamSession(std::string request_id, AdmissionSlot slot);
    ~StreamSession();

    StreamSession(const StreamSession&) = delete;
    StreamSession& operator=(const StreamSession&) = delete;

    /// @brief Move to a non-terminal state; rejects transitions the state machine forbids.
    core::Result<void> Advance(StreamState next);
    void Complete();
    void Abort(const std::string& reason);
    void Fail(const std::string& reason);

    void SetObject(std::int64_t object_id) { object_id_ = object_id; }
    void SetWindow(const ServingWindow& window) { window_ = window; }
    void AttachScheduler(std::shared_ptr<ChunkScheduler> scheduler);
    void AddBytesSent(std::uint64_t bytes) { bytes_sent_ += bytes; }

    StreamState state() const { return state_; }
    bool terminal() const { return IsTerminal(state_); }
    bool holds_slot() const { return slot_.held(); }
    std::uint64_t bytes_sent() const { return bytes_sent_; }
    const std::string& reason() const { return reason_; }
    const std::shared_ptr<ChunkScheduler>& scheduler() const { return scheduler_; }

private:
    void Finish(StreamState terminal_state, const std::string& reason);

    std::string request_id_;
    AdmissionSlot slot_;
    StreamState state_{StreamState::kAdmitted};
    std::int64_t object_id_{0};
    ServingWindow window_;
    std::uint64_t bytes_sent_{0};
    std::string reason_;
    bool streamed_{false};
    std::shared_ptr<ChunkScheduler> scheduler_;
    std::chrono::steady_clock::time_point started_;
};

}  // namespace filelink::stream

#pragma once

#include "audio_codec.h"
#include "function_dispatcher.h"
#include "session_types.h"
#include "upstream_connection.h"

#include <QJsonObject>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace voxrelay {

// Session callbacks. They fire on the session worker thread, except state changes
// made directly by Connect() or Disconnect().
class SessionListener {
public:
    virtual ~SessionListener() = default;

    virtual void OnStateChanged(SessionState state) = 0;
    virtual void OnAudio(const AudioFrame& frame) = 0;
    virtual void OnTranscript(const TranscriptEntry& entry) = 0;
    virtual void OnToolCall(const ToolCall& call) = 0;
    virtual void OnToolResult(const ToolResult& result) = 0;
    virtual void OnUiAction(const QJsonObject& action) = 0;
    virtual void OnGoAway(std::int64_t time_left_ms) = 0;
    virtual void OnTurnComplete() = 0;
    virtual void OnInterrupted() = 0;
    // Fatal errors only; always followed by OnSessionClosed(CloseReason::Error).
    virtual void OnSessionError(SessionErrorKind kind, const std::string& message) = 0;
    // Closes the session did not get from Disconnect().
    virtual void OnSessionClosed(CloseReason reason) = 0;
};

struct SessionConfig {
    std::string theme;
    std::string voice;
    std::string model;
    std::string api_key;
    std::string upstream_url;
    std::string system_instruction;
    std::string resume_handle;
};

// Owns one upstream connection and runs its receive loop on a dedicated thread.
//
// IDLE -> CONNECTING -> ACTIVE -> DEGRADED -> CLOSED, and any state -> CLOSED.
// CLOSED is terminal; resuming means a new SessionManager seeded with
// resumption_token().
class SessionManager {
public:
    using LogFn = std::function<void(const std::string&)>;

    SessionManager(
        std::string session_id,
        const FunctionDispatcher& dispatcher,
        UpstreamFactory upstream_factory,
        SessionListener& listener);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    void SetLogger(LogFn logger);

    // Returns false with ConfigurationError when no credential is configured, or
    // when called twice. Handshake failures arrive later via OnSessionError.
    bool Connect(const SessionConfig& config, SessionErrorKind* error_kind = nullptr, std::string* error = nullptr);

    // Dropped unless the session is forwarding (ACTIVE or DEGRADED) and unmuted.
    void SendAudio(AudioFrame frame);
    void SendText(const std::string& text);

    // Idempotent. Stops and joins the worker, closes upstream, enters CLOSED.
    void Disconnect();

    void SetMuted(bool muted);
    bool muted() const { return muted_.load(); }

    SessionState state() const { return state_.load(); }
    const std::string& session_id() const { return session_id_; }
    std::string resumption_token() const;
    std::vector<TranscriptEntry> transcript() const;
    std::uint64_t forwarded_frames() const { return forwarded_frames_.load(); }
    std::uint64_t muted_drops() const { return muted_drops_.load(); }

private:
    struct LoopExit {
        bool canceled = false;
        CloseReason reason = CloseReason::User;
        std::string error;
    };

    void WorkerLoop();
    LoopExit ReceiveLoop();
    // Returns false when the event ends the session.
    bool HandleEvent(UpstreamEvent& event, LoopExit* exit);
    // Returns false when the responses could not be sent upstream.
    bool HandleToolCalls(const ToolCallBatch& batch);
    void HandleTranscript(const TranscriptFragment& fragment);
    void HandleGoAway(const GoAway& go_away);
    void DrainPendingAudio();
    void DrainPendingText();
    bool SetState(SessionState next);
    bool IsForwarding() const;
    void Log(const std::string& msg) const;

    const std::string session_id_;
    const FunctionDispatcher& dispatcher_;
    UpstreamFactory upstream_factory_;
    SessionListener& listener_;
    LogFn logger_;
    SessionConfig config_;

    std::atomic<SessionState> state_{SessionState::Idle};
    std::mutex state_mu_;
    std::atomic<bool> running_{false};
    std::atomic<bool> muted_{false};
    std::mutex lifecycle_mu_;
    std::thread worker_;

    // Touched only by the worker.
    std::unique_ptr<UpstreamConnection> upstream_;
    bool go_away_armed_ = false;
    std::chrono::steady_clock::time_point go_away_deadline_;

    std::mutex pending_audio_mu_;
    std::vector<AudioFrame> pending_audio_;
    std::mutex pending_text_mu_;
    std::vector<std::string> pending_text_;

    mutable std::mutex resumption_mu_;
    std::string resumption_token_;
    mutable std::mutex transcript_mu_;
    std::vector<TranscriptEntry> transcript_;

    std::atomic<std::uint64_t> forwarded_frames_{0};
    std::atomic<std::uint64_t> muted_drops_{0};
    std::atomic<std::uint64_t> inactive_drops_{0};
};

} // namespace voxrelay

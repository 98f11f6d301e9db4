#include "session_manager.h"

#include <algorithm>
#include <iterator>
#include <sstream>
#include <utility>

namespace voxrelay {

namespace {
constexpr int kReadPollMs = 20;
constexpr std::size_t kMaxPendingAudioFrames = 64;
constexpr std::uint64_t kDropLogEvery = 50;

bool IsAllowedTransition(SessionState from, SessionState to) {
    switch (from) {
    case SessionState::Idle:
        return to == SessionState::Connecting || to == SessionState::Closed;
    case SessionState::Connecting:
        return to == SessionState::Active || to == SessionState::Closed;
    case SessionState::Active:
        return to == SessionState::Degraded || to == SessionState::Closed;
    case SessionState::Degraded:
        return to == SessionState::Closed;
    case SessionState::Closed:
        return false;
    }
    return false;
}
} // namespace

SessionManager::SessionManager(
    std::string session_id,
    const FunctionDispatcher& dispatcher,
    UpstreamFactory upstream_factory,
    SessionListener& listener)
    : session_id_(std::move(session_id)),
      dispatcher_(dispatcher),
      upstream_factory_(std::move(upstream_factory)),
      listener_(listener) {}

SessionManager::~SessionManager() {
    Disconnect();
}

void SessionManager::SetLogger(LogFn logger) {
    logger_ = std::move(logger);
}

bool SessionManager::Connect(const SessionConfig& config, SessionErrorKind* error_kind, std::string* error) {
    if (config.api_key.empty()) {
        if (error_kind) *error_kind = SessionErrorKind::Configuration;
        if (error) *error = "GEMINI_API_KEY not set";
        Log("connect rejected: no upstream credential configured");
        SetState(SessionState::Closed);
        return false;
    }
    if (!upstream_factory_) {
        if (error_kind) *error_kind = SessionErrorKind::Configuration;
        if (error) *error = "no upstream configured";
        SetState(SessionState::Closed);
        return false;
    }

    std::lock_guard<std::mutex> lock(lifecycle_mu_);
    if (!SetState(SessionState::Connecting)) {
        if (error_kind) *error_kind = SessionErrorKind::Configuration;
        if (error) *error = std::string("session already ") + SessionStateName(state());
        return false;
    }
    config_ = config;
    {
        std::lock_guard<std::mutex> token_lock(resumption_mu_);
        resumption_token_ = config.resume_handle;
    }
    running_.store(true);
    worker_ = std::thread([this] { WorkerLoop(); });
    return true;
}

void SessionManager::SendAudio(AudioFrame frame) {
    if (frame.empty()) {
        return;
    }
    if (muted_.load()) {
        const std::uint64_t drops = muted_drops_.fetch_add(1) + 1;
        if (drops == 1 || drops % kDropLogEvery == 0) {
            std::ostringstream oss;
            oss << "audio dropped while muted session=" << session_id_ << " total=" << drops;
            Log(oss.str());
        }
        return;
    }
    if (!IsForwarding()) {
        inactive_drops_.fetch_add(1);
        return;
    }
    std::lock_guard<std::mutex> lock(pending_audio_mu_);
    if (pending_audio_.size() >= kMaxPendingAudioFrames) {
        // The worker is behind; stale microphone audio is worthless.
        pending_audio_.erase(pending_audio_.begin());
        inactive_drops_.fetch_add(1);
    }
    pending_audio_.push_back(std::move(frame));
}

void SessionManager::SendText(const std::string& text) {
    if (text.empty()) {
        return;
    }
    if (!IsForwarding()) {
        std::ostringstream oss;
        oss << "text dropped session=" << session_id_ << " state=" << SessionStateName(state());
        Log(oss.str());
        return;
    }
    std::lock_guard<std::mutex> lock(pending_text_mu_);
    pending_text_.push_back(text);
}

void SessionManager::Disconnect() {
    running_.store(false);
    bool joined = false;
    {
        std::lock_guard<std::mutex> lock(lifecycle_mu_);
        if (worker_.joinable()) {
            if (worker_.get_id() == std::this_thread::get_id()) {
                // Called from a listener callback; the worker exits on its own.
                return;
            }
            worker_.join();
            joined = true;
        }
    }
    if (SetState(SessionState::Closed) || joined) {
        std::ostringstream oss;
        oss << "session disconnected session=" << session_id_ << " forwarded=" << forwarded_frames_.load()
            << " muted_drops=" << muted_drops_.load();
        Log(oss.str());
    }
}

void SessionManager::SetMuted(bool muted) {
    if (muted_.exchange(muted) != muted) {
        std::ostringstream oss;
        oss << "mute session=" << session_id_ << " muted=" << (muted ? "true" : "false");
        Log(oss.str());
    }
}

std::string SessionManager::resumption_token() const {
    std::lock_guard<std::mutex> lock(resumption_mu_);
    return resumption_token_;
}

std::vector<TranscriptEntry> SessionManager::transcript() const {
    std::lock_guard<std::mutex> lock(transcript_mu_);
    return transcript_;
}

void SessionManager::WorkerLoop() {
    Log("session worker started session=" + session_id_);

    UpstreamSetup setup;
    setup.url = config_.upstream_url;
    setup.api_key = config_.api_key;
    setup.model = config_.model;
    setup.voice = config_.voice;
    setup.system_instruction = config_.system_instruction;
    setup.resume_handle = resumption_token();
    setup.tools = &dispatcher_.registry();

    upstream_ = upstream_factory_();
    std::string error;
    bool opened = false;
    if (!upstream_) {
        error = "upstream factory returned nothing";
    } else {
        upstream_->SetLogger(logger_);
        opened = upstream_->Open(setup, [this] { return running_.load(); }, &error);
    }

    if (!opened) {
        upstream_.reset();
        if (!running_.load()) {
            Log("session worker canceled during handshake session=" + session_id_);
            SetState(SessionState::Closed);
            return;
        }
        running_.store(false);
        std::ostringstream oss;
        oss << "upstream handshake failed session=" << session_id_ << " error=" << error;
        Log(oss.str());
        listener_.OnSessionError(SessionErrorKind::UpstreamUnavailable, "Upstream unavailable: " + error);
        SetState(SessionState::Closed);
        listener_.OnSessionClosed(CloseReason::Error);
        return;
    }

    if (!SetState(SessionState::Active)) {
        upstream_->Close();
        upstream_.reset();
        return;
    }

    const LoopExit exit = ReceiveLoop();
    upstream_->Close();
    upstream_.reset();

    if (exit.canceled) {
        Log("session worker stopped session=" + session_id_);
        SetState(SessionState::Closed);
        return;
    }

    running_.store(false);
    {
        std::ostringstream oss;
        oss << "session ended session=" << session_id_ << " reason=" << CloseReasonName(exit.reason);
        if (!exit.error.empty()) {
            oss << " error=" << exit.error;
        }
        Log(oss.str());
    }
    if (exit.reason == CloseReason::Error) {
        listener_.OnSessionError(SessionErrorKind::UpstreamLost, "Session lost: " + exit.error);
    }
    SetState(SessionState::Closed);
    listener_.OnSessionClosed(exit.reason);
}

SessionManager::LoopExit SessionManager::ReceiveLoop() {
    LoopExit exit;
    go_away_armed_ = false;

    while (running_.load()) {
        DrainPendingText();
        DrainPendingAudio();

        int poll_ms = kReadPollMs;
        if (go_away_armed_) {
            const auto now = std::chrono::steady_clock::now();
            if (now >= go_away_deadline_) {
                exit.reason = CloseReason::Timeout;
                return exit;
            }
            const auto remaining =
                std::chrono::duration_cast<std::chrono::milliseconds>(go_away_deadline_ - now).count();
            poll_ms = static_cast<int>(std::min<long long>(poll_ms, std::max<long long>(1, remaining)));
        }

        UpstreamEvent event;
        const UpstreamConnection::ReadResult read_result = upstream_->TryReadEvent(&event, poll_ms);
        if (read_result == UpstreamConnection::ReadResult::Event) {
            if (!HandleEvent(event, &exit)) {
                return exit;
            }
            continue;
        }
        if (read_result == UpstreamConnection::ReadResult::Disconnected) {
            exit.reason = CloseReason::UpstreamClosed;
            return exit;
        }
        // timeout; keep polling
    }

    exit.canceled = true;
    return exit;
}

bool SessionManager::HandleEvent(UpstreamEvent& event, LoopExit* exit) {
    if (auto* audio = std::get_if<AudioChunk>(&event)) {
        listener_.OnAudio(AudioFrame(AudioDirection::Outbound, session_id_, std::move(audio->samples)));
        return true;
    }
    if (const auto* batch = std::get_if<ToolCallBatch>(&event)) {
        if (!HandleToolCalls(*batch)) {
            exit->reason = CloseReason::Error;
            exit->error = "tool response send failed";
            return false;
        }
        return true;
    }
    if (const auto* fragment = std::get_if<TranscriptFragment>(&event)) {
        HandleTranscript(*fragment);
        return true;
    }
    if (std::holds_alternative<TurnComplete>(event)) {
        listener_.OnTurnComplete();
        return true;
    }
    if (std::holds_alternative<Interrupted>(event)) {
        listener_.OnInterrupted();
        return true;
    }
    if (const auto* update = std::get_if<ResumptionUpdate>(&event)) {
        if (update->resumable && !update->new_handle.empty()) {
            std::lock_guard<std::mutex> lock(resumption_mu_);
            resumption_token_ = update->new_handle;
        }
        return true;
    }
    if (const auto* go_away = std::get_if<GoAway>(&event)) {
        HandleGoAway(*go_away);
        return true;
    }
    if (const auto* cancel = std::get_if<ToolCallCancellation>(&event)) {
        std::ostringstream oss;
        oss << "tool call cancellation ignored session=" << session_id_ << " ids=";
        for (std::size_t i = 0; i < cancel->ids.size(); ++i) {
            oss << (i ? "," : "") << cancel->ids[i];
        }
        Log(oss.str());
        return true;
    }
    if (const auto* err = std::get_if<UpstreamError>(&event)) {
        exit->reason = CloseReason::Error;
        exit->error = err->message.empty() ? "upstream error" : err->message;
        return false;
    }
    return true;
}

bool SessionManager::HandleToolCalls(const ToolCallBatch& batch) {
    ToolContext ctx;
    ctx.session_id = session_id_;
    ctx.emit_ui_action = [this](const QJsonObject& action) { listener_.OnUiAction(action); };

    std::vector<ToolResult> results;
    results.reserve(batch.calls.size());
    for (const auto& call : batch.calls) {
        listener_.OnToolCall(call);
        ToolResult result = dispatcher_.Dispatch(call, ctx);
        listener_.OnToolResult(result);
        results.push_back(std::move(result));
    }
    if (!upstream_->SendToolResponses(results)) {
        std::ostringstream oss;
        oss << "tool response send failed session=" << session_id_ << " count=" << results.size();
        Log(oss.str());
        return false;
    }
    return true;
}

void SessionManager::HandleTranscript(const TranscriptFragment& fragment) {
    TranscriptEntry entry;
    entry.role = fragment.role;
    entry.text = fragment.text;
    entry.timestamp_ms = NowUnixMs();
    {
        std::lock_guard<std::mutex> lock(transcript_mu_);
        transcript_.push_back(entry);
    }
    listener_.OnTranscript(entry);
}

void SessionManager::HandleGoAway(const GoAway& go_away) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(go_away.time_left_ms);
    if (go_away_armed_) {
        go_away_deadline_ = std::min(go_away_deadline_, deadline);
        return;
    }
    if (!SetState(SessionState::Degraded)) {
        return;
    }
    go_away_armed_ = true;
    go_away_deadline_ = deadline;
    std::ostringstream oss;
    oss << "upstream go_away session=" << session_id_ << " time_left_ms=" << go_away.time_left_ms;
    Log(oss.str());
    listener_.OnGoAway(go_away.time_left_ms);
}

void SessionManager::DrainPendingAudio() {
    std::vector<AudioFrame> pending;
    {
        std::lock_guard<std::mutex> lock(pending_audio_mu_);
        if (pending_audio_.empty()) {
            return;
        }
        pending.swap(pending_audio_);
    }
    for (const auto& frame : pending) {
        if (muted_.load()) {
            muted_drops_.fetch_add(1);
            continue;
        }
        if (!upstream_->SendAudio(frame)) {
            // Not retried; a dead transport shows up on the next read.
            Log("audio send failed session=" + session_id_);
            return;
        }
        forwarded_frames_.fetch_add(1);
    }
}

void SessionManager::DrainPendingText() {
    std::vector<std::string> pending;
    {
        std::lock_guard<std::mutex> lock(pending_text_mu_);
        if (pending_text_.empty()) {
            return;
        }
        pending.swap(pending_text_);
    }
    for (const auto& text : pending) {
        if (!upstream_->SendText(text)) {
            std::ostringstream oss;
            oss << "text send failed session=" << session_id_ << " chars=" << text.size();
            Log(oss.str());
            return;
        }
    }
}

bool SessionManager::SetState(SessionState next) {
    SessionState prev;
    {
        std::lock_guard<std::mutex> lock(state_mu_);
        prev = state_.load();
        if (!IsAllowedTransition(prev, next)) {
            return false;
        }
        state_.store(next);
    }
    std::ostringstream oss;
    oss << "session state session=" << session_id_ << " " << SessionStateName(prev) << "->"
        << SessionStateName(next);
    Log(oss.str());
    listener_.OnStateChanged(next);
    return true;
}

bool SessionManager::IsForwarding() const {
    const SessionState s = state_.load();
    return s == SessionState::Active || s == SessionState::Degraded;
}

void SessionManager::Log(const std::string& msg) const {
    if (logger_) {
        logger_(msg);
    }
}

} // namespace voxrelay

#include "relay_endpoint.h"

#include "control_protocol.h"
#include "relay_config.h"

#include <sstream>
#include <utility>

namespace voxrelay {

RelayEndpoint::RelayEndpoint(
    std::shared_ptr<ClientTransport> transport,
    const FunctionDispatcher& dispatcher,
    UpstreamFactory upstream_factory,
    EndpointSettings settings)
    : transport_(std::move(transport)),
      dispatcher_(dispatcher),
      upstream_factory_(std::move(upstream_factory)),
      settings_(std::move(settings)) {}

RelayEndpoint::~RelayEndpoint() {
    OnTransportClosed();
}

void RelayEndpoint::SetLogger(LogFn logger) {
    logger_ = std::move(logger);
}

void RelayEndpoint::HandleTextFrame(const std::string& text) {
    ClientMessage msg;
    std::string error;
    if (!TryParseClientMessage(text, &msg, &error)) {
        protocol_violations_.fetch_add(1);
        std::ostringstream oss;
        oss << "client frame dropped violation=" << error << " bytes=" << text.size();
        Log(oss.str());
        return;
    }

    if (msg.type == ClientMessageType::Start) {
        HandleStart(msg.theme, msg.voice, msg.resume_handle);
        return;
    }

    SessionManager* session = nullptr;
    {
        std::lock_guard<std::mutex> lock(session_mu_);
        session = session_.get();
        if (!session && msg.type == ClientMessageType::Mute) {
            pending_muted_ = msg.has_muted ? msg.muted : !pending_muted_;
            Log(std::string("mute held until start muted=") + (pending_muted_ ? "true" : "false"));
            return;
        }
    }
    if (!session) {
        if (msg.type == ClientMessageType::End) {
            HandleEnd();
            return;
        }
        Log("client frame dropped before start");
        return;
    }

    switch (msg.type) {
    case ClientMessageType::Mute:
        session->SetMuted(msg.has_muted ? msg.muted : !session->muted());
        break;
    case ClientMessageType::Text:
        session->SendText(msg.content);
        break;
    case ClientMessageType::End:
        HandleEnd();
        break;
    case ClientMessageType::Start:
        break;
    }
}

void RelayEndpoint::HandleBinaryFrame(const std::uint8_t* data, std::size_t len) {
    SessionManager* session = nullptr;
    {
        std::lock_guard<std::mutex> lock(session_mu_);
        session = session_.get();
    }
    if (!session || ended_.load()) {
        return;
    }
    session->SendAudio(AudioFrame::FromBytes(AudioDirection::Inbound, session->session_id(), data, len));
}

void RelayEndpoint::OnTransportClosed() {
    ended_.store(true);
    SessionManager* session = nullptr;
    {
        std::lock_guard<std::mutex> lock(session_mu_);
        session = session_.get();
    }
    if (session) {
        session->Disconnect();
    }
}

bool RelayEndpoint::started() const {
    std::lock_guard<std::mutex> lock(session_mu_);
    return session_ != nullptr;
}

SessionState RelayEndpoint::session_state() const {
    std::lock_guard<std::mutex> lock(session_mu_);
    return session_ ? session_->state() : SessionState::Idle;
}

std::string RelayEndpoint::session_id() const {
    std::lock_guard<std::mutex> lock(session_mu_);
    return session_ ? session_->session_id() : std::string();
}

void RelayEndpoint::HandleStart(const std::string& theme, const std::string& voice, const std::string& resume_handle) {
    if (ended_.load()) {
        return;
    }
    SessionManager* session = nullptr;
    {
        std::lock_guard<std::mutex> lock(session_mu_);
        if (session_) {
            Log("duplicate start dropped session=" + session_->session_id());
            return;
        }
        voice_ = voice.empty() ? VoiceForTheme(theme) : voice;
        session_ = std::make_unique<SessionManager>(NewSessionId(), dispatcher_, upstream_factory_, *this);
        session_->SetLogger(logger_);
        session_->SetMuted(pending_muted_);
        session = session_.get();
    }

    SessionConfig config;
    config.theme = theme;
    config.voice = voice_;
    config.model = settings_.model;
    config.api_key = settings_.api_key;
    config.upstream_url = settings_.upstream_url;
    config.resume_handle = resume_handle;
    if (settings_.build_system_instruction) {
        config.system_instruction = settings_.build_system_instruction(theme);
    }

    {
        std::ostringstream oss;
        oss << "session start session=" << session->session_id() << " theme=" << theme << " voice=" << voice_
            << " resuming=" << (resume_handle.empty() ? "false" : "true");
        Log(oss.str());
    }

    SessionErrorKind kind = SessionErrorKind::Configuration;
    std::string error;
    if (!session->Connect(config, &kind, &error)) {
        Log("session connect rejected session=" + session->session_id() + " error=" + error);
        if (!ended_.load()) {
            Send(BuildErrorMessage(kind, error));
        }
        FinishSession(CloseReason::Error);
    }
}

void RelayEndpoint::HandleEnd() {
    SessionManager* session = nullptr;
    {
        std::lock_guard<std::mutex> lock(session_mu_);
        session = session_.get();
    }
    if (session) {
        session->Disconnect();
    }
    FinishSession(CloseReason::User);
}

void RelayEndpoint::FinishSession(CloseReason reason) {
    if (ended_.exchange(true)) {
        return;
    }
    std::string token;
    {
        std::lock_guard<std::mutex> lock(session_mu_);
        if (session_) {
            token = session_->resumption_token();
        }
    }
    {
        std::ostringstream oss;
        oss << "session_end reason=" << CloseReasonName(reason) << " resumable=" << (token.empty() ? "false" : "true");
        Log(oss.str());
    }
    transport_->SendText(BuildSessionEndMessage(reason, token));
    transport_->Close();
}

void RelayEndpoint::OnStateChanged(SessionState state) {
    if (state != SessionState::Active) {
        return;
    }
    std::string id;
    {
        std::lock_guard<std::mutex> lock(session_mu_);
        if (session_) {
            id = session_->session_id();
        }
    }
    Send(BuildReadyMessage(id, voice_));
}

void RelayEndpoint::OnAudio(const AudioFrame& frame) {
    if (ended_.load()) {
        return;
    }
    transport_->SendBinary(frame.ToBytes());
}

void RelayEndpoint::OnTranscript(const TranscriptEntry& entry) {
    Send(BuildTranscriptMessage(entry));
}

void RelayEndpoint::OnToolCall(const ToolCall& call) {
    Send(BuildToolCallMessage(call));
}

void RelayEndpoint::OnToolResult(const ToolResult& result) {
    Send(BuildToolResultMessage(result));
}

void RelayEndpoint::OnUiAction(const QJsonObject& action) {
    Send(BuildUiActionMessage(action));
}

void RelayEndpoint::OnGoAway(std::int64_t time_left_ms) {
    Send(BuildGoAwayMessage(time_left_ms));
}

void RelayEndpoint::OnTurnComplete() {
    Send(BuildTurnCompleteMessage());
}

void RelayEndpoint::OnInterrupted() {
    Send(BuildInterruptedMessage());
}

void RelayEndpoint::OnSessionError(SessionErrorKind kind, const std::string& message) {
    Send(BuildErrorMessage(kind, message));
}

void RelayEndpoint::OnSessionClosed(CloseReason reason) {
    FinishSession(reason);
}

void RelayEndpoint::Send(const std::string& json) {
    if (ended_.load()) {
        return;
    }
    transport_->SendText(json);
}

void RelayEndpoint::Log(const std::string& msg) const {
    if (logger_) {
        logger_(msg);
    }
}

} // namespace voxrelay

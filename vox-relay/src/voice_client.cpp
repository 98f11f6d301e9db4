#include "voice_client.h"

#include "audio_codec.h"

#include <QAbstractSocket>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonValue>
#include <QWebSocket>

#include <sstream>
#include <utility>

namespace voxrelay {

namespace {

std::string JsonString(const QJsonObject& obj, const char* key) {
    return obj.value(QString::fromUtf8(key)).toString().toStdString();
}

std::string CompactJson(const QJsonValue& value) {
    if (value.isObject()) {
        return QJsonDocument(value.toObject()).toJson(QJsonDocument::Compact).toStdString();
    }
    if (value.isArray()) {
        return QJsonDocument(value.toArray()).toJson(QJsonDocument::Compact).toStdString();
    }
    return value.toVariant().toString().toStdString();
}

} // namespace

VoiceClient::VoiceClient(QUrl relay_url, Callbacks callbacks)
    : relay_url_(std::move(relay_url)), callbacks_(std::move(callbacks)) {
    capture_.SetChunkHandler([this](std::vector<std::int16_t> samples) {
        if (!socket_ || !connected_ || !in_session_) {
            return;
        }
        const std::vector<std::uint8_t> bytes = EncodePcm16Le(samples.data(), samples.size());
        socket_->sendBinaryMessage(
            QByteArray(reinterpret_cast<const char*>(bytes.data()), static_cast<qsizetype>(bytes.size())));
        ++audio_frames_sent_;
    });
    playback_.SetSpeakingChanged([this](bool speaking) {
        if (callbacks_.on_speaking_changed) {
            callbacks_.on_speaking_changed(speaking);
        }
    });
}

VoiceClient::~VoiceClient() {
    Close();
}

void VoiceClient::SetLogger(LogFn logger) {
    logger_ = std::move(logger);
    capture_.SetLogger(logger_);
    playback_.SetLogger(logger_);
}

void VoiceClient::SetAudioEnabled(bool enabled) {
    audio_enabled_ = enabled;
}

void VoiceClient::Start(const std::string& theme) {
    if (in_session_) {
        Log("start ignored (session active)");
        return;
    }
    pending_theme_ = theme.empty() ? std::string(kDefaultTheme) : theme;
    start_pending_ = true;
    EnsureSocket();
    if (connected_) {
        OnConnected();
    }
}

void VoiceClient::SetMuted(bool muted) {
    capture_.SetMuted(muted);
    if (in_session_) {
        SendControl(BuildMuteMessage(muted));
    }
    Log(muted ? "muted" : "unmuted");
}

void VoiceClient::SendText(const std::string& content) {
    if (!in_session_) {
        Log("text ignored (no session)");
        return;
    }
    if (content.empty()) {
        return;
    }
    SendControl(BuildTextMessage(content));
}

void VoiceClient::End() {
    if (!in_session_) {
        Log("end ignored (no session)");
        return;
    }
    SendControl(BuildEndMessage());
}

void VoiceClient::Close() {
    StopAudio();
    in_session_ = false;
    start_pending_ = false;
    if (!socket_) {
        return;
    }
    QObject::disconnect(socket_.get(), nullptr, nullptr, nullptr);
    if (socket_->state() != QAbstractSocket::UnconnectedState) {
        socket_->close(QWebSocketProtocol::CloseCodeNormal);
    }
    socket_.reset();
    connected_ = false;
}

std::string VoiceClient::Describe() const {
    std::ostringstream oss;
    oss << "connected=" << (connected_ ? "true" : "false") << " in_session=" << (in_session_ ? "true" : "false")
        << " session_id=" << (session_id_.empty() ? "-" : session_id_) << " voice=" << (voice_.empty() ? "-" : voice_)
        << " muted=" << (capture_.muted() ? "true" : "false")
        << " speaking=" << (playback_.IsSpeaking() ? "true" : "false") << " audio_sent=" << audio_frames_sent_
        << " audio_received=" << audio_frames_received_ << " resumable=" << (resume_handle_.empty() ? "false" : "true");
    return oss.str();
}

void VoiceClient::EnsureSocket() {
    if (socket_) {
        return;
    }
    socket_ = std::make_unique<QWebSocket>();
    QWebSocket* socket = socket_.get();
    QObject::connect(socket, &QWebSocket::connected, socket, [this]() {
        connected_ = true;
        Log("connected url=" + relay_url_.toString().toStdString());
        OnConnected();
    });
    QObject::connect(socket, &QWebSocket::disconnected, socket, [this]() { OnDisconnected(); });
    QObject::connect(
        socket, &QWebSocket::textMessageReceived, socket, [this](const QString& message) { OnTextMessage(message); });
    QObject::connect(socket, &QWebSocket::binaryMessageReceived, socket, [this](const QByteArray& payload) {
        OnBinaryMessage(payload);
    });
    QObject::connect(socket, &QWebSocket::errorOccurred, socket, [this](QAbstractSocket::SocketError) {
        if (socket_) {
            Log("socket error " + socket_->errorString().toStdString());
        }
    });
    socket->open(relay_url_);
}

void VoiceClient::OnConnected() {
    if (!start_pending_) {
        return;
    }
    start_pending_ = false;
    in_session_ = true;
    audio_frames_received_ = 0;
    audio_frames_sent_ = 0;
    SendControl(BuildStartMessage(pending_theme_, std::string(), resume_handle_));
    std::ostringstream oss;
    oss << "start sent theme=" << pending_theme_ << " resume=" << (resume_handle_.empty() ? "false" : "true");
    Log(oss.str());
}

void VoiceClient::OnDisconnected() {
    const bool was_in_session = in_session_;
    StopAudio();
    in_session_ = false;
    connected_ = false;
    start_pending_ = false;
    if (socket_) {
        QObject::disconnect(socket_.get(), nullptr, nullptr, nullptr);
        // Released on the next loop turn; this slot runs inside the socket's signal.
        socket_.release()->deleteLater();
    }
    Log(was_in_session ? "disconnected during session" : "disconnected");
    if (callbacks_.on_disconnected) {
        callbacks_.on_disconnected();
    }
}

void VoiceClient::OnTextMessage(const QString& message) {
    ServerMessage msg;
    if (!TryParseServerMessage(message.toStdString(), &msg)) {
        Log("ignored malformed server message");
        return;
    }
    HandleServerMessage(msg);
}

void VoiceClient::OnBinaryMessage(const QByteArray& payload) {
    ++audio_frames_received_;
    if (!audio_enabled_ || !playback_.IsRunning()) {
        return;
    }
    playback_.Enqueue(
        DecodePcm16Le(reinterpret_cast<const std::uint8_t*>(payload.constData()), static_cast<std::size_t>(payload.size())));
}

void VoiceClient::HandleServerMessage(const ServerMessage& msg) {
    const QJsonObject& body = msg.body;
    if (msg.type == "ready") {
        session_id_ = JsonString(body, "sessionId");
        voice_ = JsonString(body, "voice");
        StartAudio();
        if (callbacks_.on_ready) {
            callbacks_.on_ready(session_id_, voice_);
        }
    } else if (msg.type == "transcript") {
        if (callbacks_.on_transcript) {
            callbacks_.on_transcript(JsonString(body, "role"), JsonString(body, "text"));
        }
    } else if (msg.type == "tool_call") {
        if (callbacks_.on_tool_event) {
            callbacks_.on_tool_event(
                "call " + JsonString(body, "name") + " id=" + JsonString(body, "id") + " args=" +
                CompactJson(body.value(QStringLiteral("args"))));
        }
    } else if (msg.type == "tool_result") {
        if (callbacks_.on_tool_event) {
            callbacks_.on_tool_event(
                "result " + JsonString(body, "name") + " id=" + JsonString(body, "id") + " data=" +
                CompactJson(body.value(QStringLiteral("data"))));
        }
    } else if (msg.type == "ui_action") {
        if (callbacks_.on_tool_event) {
            callbacks_.on_tool_event("ui_action " + CompactJson(body));
        }
    } else if (msg.type == "interrupted") {
        playback_.Interrupt();
        Log("interrupted; playback flushed");
    } else if (msg.type == "turn_complete") {
        Log("turn complete");
    } else if (msg.type == "go_away") {
        std::ostringstream oss;
        oss << "relay warned session ends in time_left_ms="
            << body.value(QStringLiteral("time_left_ms")).toVariant().toLongLong();
        Log(oss.str());
    } else if (msg.type == "error") {
        if (callbacks_.on_error) {
            callbacks_.on_error(JsonString(body, "code"), JsonString(body, "message"));
        }
    } else if (msg.type == "session_end") {
        const std::string handle = JsonString(body, "resume_handle");
        if (!handle.empty()) {
            resume_handle_ = handle;
        }
        capture_.Stop();
        in_session_ = false;
        if (callbacks_.on_session_end) {
            callbacks_.on_session_end(JsonString(body, "reason"));
        }
    } else {
        Log("ignored server message type=" + msg.type);
    }
}

void VoiceClient::SendControl(const std::string& json) {
    if (!socket_ || !connected_) {
        Log("control message dropped (not connected)");
        return;
    }
    socket_->sendTextMessage(QString::fromStdString(json));
}

void VoiceClient::StartAudio() {
    if (!audio_enabled_) {
        return;
    }
    std::string error;
    if (!playback_.Start(&error)) {
        Log("playback unavailable " + error);
    }
    if (!capture_.Start(&error)) {
        Log("capture unavailable " + error);
    }
}

void VoiceClient::StopAudio() {
    capture_.Stop();
    playback_.Stop();
}

void VoiceClient::Log(const std::string& msg) const {
    if (logger_) {
        logger_(msg);
    }
}

} // namespace voxrelay

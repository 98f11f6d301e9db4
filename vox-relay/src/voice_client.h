#pragma once

#include "audio_capture.h"
#include "audio_playback.h"
#include "control_protocol.h"

#include <QUrl>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

class QWebSocket;

namespace voxrelay {

// Desktop side of the relay: one WebSocket to the relay endpoint plus the
// microphone and speaker pipeline. Lives on the Qt main thread; every method
// must be called there.
class VoiceClient {
public:
    using LogFn = std::function<void(const std::string&)>;

    struct Callbacks {
        std::function<void(const std::string& session_id, const std::string& voice)> on_ready;
        std::function<void(const std::string& role, const std::string& text)> on_transcript;
        std::function<void(const std::string& line)> on_tool_event;
        std::function<void(const std::string& code, const std::string& message)> on_error;
        std::function<void(const std::string& reason)> on_session_end;
        std::function<void(bool speaking)> on_speaking_changed;
        std::function<void()> on_disconnected;
    };

    VoiceClient(QUrl relay_url, Callbacks callbacks);
    ~VoiceClient();

    VoiceClient(const VoiceClient&) = delete;
    VoiceClient& operator=(const VoiceClient&) = delete;

    void SetLogger(LogFn logger);

    // Without audio the client still drives the control protocol; received
    // audio is counted and discarded.
    void SetAudioEnabled(bool enabled);

    // Opens the socket if needed and sends `start` once connected. A resume
    // handle from the previous session_end is reused automatically.
    void Start(const std::string& theme);
    void SetMuted(bool muted);
    void SendText(const std::string& content);
    void End();
    void Close();

    bool connected() const { return connected_; }
    bool in_session() const { return in_session_; }
    bool muted() const { return capture_.muted(); }
    std::string Describe() const;

private:
    void EnsureSocket();
    void OnConnected();
    void OnDisconnected();
    void OnTextMessage(const QString& message);
    void OnBinaryMessage(const QByteArray& payload);
    void HandleServerMessage(const ServerMessage& msg);
    void SendControl(const std::string& json);
    void StartAudio();
    void StopAudio();
    void Log(const std::string& msg) const;

    QUrl relay_url_;
    Callbacks callbacks_;
    LogFn logger_;
    std::unique_ptr<QWebSocket> socket_;
    AudioCapture capture_;
    AudioPlayback playback_;

    bool audio_enabled_ = true;
    bool connected_ = false;
    bool in_session_ = false;
    bool start_pending_ = false;
    std::string pending_theme_ = kDefaultTheme;
    std::string session_id_;
    std::string voice_;
    std::string resume_handle_;
    std::uint64_t audio_frames_received_ = 0;
    std::uint64_t audio_frames_sent_ = 0;
};

} // namespace voxrelay

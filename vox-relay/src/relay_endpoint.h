#pragma once

#include "function_dispatcher.h"
#include "session_manager.h"
#include "upstream_connection.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace voxrelay {

// Client-facing half of a connection. Safe to call from any thread; writes go
// out in call order.
class ClientTransport {
public:
    virtual ~ClientTransport() = default;

    virtual void SendText(const std::string& json) = 0;
    virtual void SendBinary(std::vector<std::uint8_t> bytes) = 0;
    virtual void Close() = 0;
};

struct EndpointSettings {
    std::string api_key;
    std::string model;
    std::string upstream_url;
    std::function<std::string(const std::string& theme)> build_system_instruction;
};

// One client connection: decodes its frames, drives a SessionManager and
// serializes the session's callbacks back to the client.
class RelayEndpoint : public SessionListener {
public:
    using LogFn = std::function<void(const std::string&)>;

    RelayEndpoint(
        std::shared_ptr<ClientTransport> transport,
        const FunctionDispatcher& dispatcher,
        UpstreamFactory upstream_factory,
        EndpointSettings settings);
    ~RelayEndpoint() override;

    RelayEndpoint(const RelayEndpoint&) = delete;
    RelayEndpoint& operator=(const RelayEndpoint&) = delete;

    void SetLogger(LogFn logger);

    void HandleTextFrame(const std::string& text);
    void HandleBinaryFrame(const std::uint8_t* data, std::size_t len);

    // Tears the session down; must run before the endpoint is released.
    void OnTransportClosed();

    bool started() const;
    SessionState session_state() const;
    std::string session_id() const;
    std::uint64_t protocol_violations() const { return protocol_violations_.load(); }

    void OnStateChanged(SessionState state) override;
    void OnAudio(const AudioFrame& frame) override;
    void OnTranscript(const TranscriptEntry& entry) override;
    void OnToolCall(const ToolCall& call) override;
    void OnToolResult(const ToolResult& result) override;
    void OnUiAction(const QJsonObject& action) override;
    void OnGoAway(std::int64_t time_left_ms) override;
    void OnTurnComplete() override;
    void OnInterrupted() override;
    void OnSessionError(SessionErrorKind kind, const std::string& message) override;
    void OnSessionClosed(CloseReason reason) override;

private:
    void HandleStart(const std::string& theme, const std::string& voice, const std::string& resume_handle);
    void HandleEnd();
    // Sends session_end once and closes the transport.
    void FinishSession(CloseReason reason);
    void Send(const std::string& json);
    void Log(const std::string& msg) const;

    std::shared_ptr<ClientTransport> transport_;
    const FunctionDispatcher& dispatcher_;
    UpstreamFactory upstream_factory_;
    EndpointSettings settings_;
    LogFn logger_;

    mutable std::mutex session_mu_;
    std::unique_ptr<SessionManager> session_;
    std::string voice_;
    // Mute requested before start; applied to the session once it exists.
    bool pending_muted_ = false;

    std::atomic<bool> ended_{false};
    std::atomic<std::uint64_t> protocol_violations_{0};
};

} // namespace voxrelay

#pragma once

#include "upstream_connection.h"

#include <QByteArray>

#include <deque>
#include <memory>
#include <string>

class QEventLoop;
class QTimer;
class QWebSocket;

namespace voxrelay {

// Production upstream over QWebSocket. The socket is created inside Open() so it
// belongs to the calling session thread; reads pump a local QEventLoop.
class GeminiLiveConnection : public UpstreamConnection {
public:
    GeminiLiveConnection();
    ~GeminiLiveConnection() override;

    GeminiLiveConnection(const GeminiLiveConnection&) = delete;
    GeminiLiveConnection& operator=(const GeminiLiveConnection&) = delete;

    void SetLogger(LogFn logger) override;

    bool Open(const UpstreamSetup& setup, const ContinueFn& should_continue, std::string* error) override;
    ReadResult TryReadEvent(UpstreamEvent* out, int timeout_ms) override;
    bool SendAudio(const AudioFrame& frame) override;
    bool SendText(const std::string& text) override;
    bool SendToolResponses(const std::vector<ToolResult>& results) override;
    void Close() override;

private:
    bool SendJson(const std::string& json);
    // Runs the socket's event loop until something arrives, the socket drops
    // or the timeout passes.
    void PumpEvents(int timeout_ms);
    void HandleMessage(const QByteArray& payload);
    void Log(const std::string& msg) const;

    std::unique_ptr<QEventLoop> loop_;
    std::unique_ptr<QTimer> timer_;
    std::unique_ptr<QWebSocket> socket_;
    std::deque<UpstreamEvent> pending_events_;
    bool setup_complete_ = false;
    bool disconnected_ = false;
    bool error_reported_ = false;
    std::string close_error_;
    LogFn logger_;
};

} // namespace voxrelay

#pragma once

#include "function_dispatcher.h"
#include "relay_config.h"
#include "relay_endpoint.h"
#include "upstream_connection.h"

#include <QObject>
#include <QPointer>
#include <QWebSocket>
#include <QWebSocketServer>

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace voxrelay {

// ClientTransport over a QWebSocket. Writes are queued onto the socket's thread
// and silently dropped once the socket is gone.
class QtClientTransport : public ClientTransport {
public:
    explicit QtClientTransport(QWebSocket* socket);

    void SendText(const std::string& json) override;
    void SendBinary(std::vector<std::uint8_t> bytes) override;
    void Close() override;

private:
    QPointer<QWebSocket> socket_;
};

class RelayServer : public QObject {
    Q_OBJECT

public:
    using LogFn = std::function<void(const std::string&)>;

    RelayServer(
        RelayConfig config,
        const FunctionDispatcher& dispatcher,
        UpstreamFactory upstream_factory,
        std::function<std::string(const std::string& theme)> build_system_instruction,
        QObject* parent = nullptr);
    ~RelayServer() override;

    void SetLogger(LogFn logger);

    bool Listen(std::string* error);
    void Close();

    quint16 port() const;
    std::size_t active_sessions() const { return endpoints_.size(); }

private slots:
    void OnNewConnection();

private:
    void RejectConnection(QWebSocket* socket, SessionErrorKind kind, const std::string& message);
    void ReleaseEndpoint(QWebSocket* socket);
    void Log(const std::string& msg) const;

    RelayConfig config_;
    const FunctionDispatcher& dispatcher_;
    UpstreamFactory upstream_factory_;
    std::function<std::string(const std::string&)> build_system_instruction_;
    QWebSocketServer server_;
    std::map<QWebSocket*, std::unique_ptr<RelayEndpoint>> endpoints_;
    LogFn logger_;
};

} // namespace voxrelay

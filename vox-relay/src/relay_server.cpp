#include "relay_server.h"

#include "control_protocol.h"

#include <QByteArray>
#include <QHostAddress>
#include <QMetaObject>
#include <QString>
#include <QUrl>

#include <sstream>
#include <utility>

namespace voxrelay {

QtClientTransport::QtClientTransport(QWebSocket* socket)
    : socket_(socket) {}

void QtClientTransport::SendText(const std::string& json) {
    QPointer<QWebSocket> socket = socket_;
    if (!socket) {
        return;
    }
    const QString message = QString::fromStdString(json);
    QMetaObject::invokeMethod(
        socket.data(),
        [socket, message]() {
            if (!socket) {
                return;
            }
            socket->sendTextMessage(message);
        },
        Qt::QueuedConnection);
}

void QtClientTransport::SendBinary(std::vector<std::uint8_t> bytes) {
    QPointer<QWebSocket> socket = socket_;
    if (!socket) {
        return;
    }
    const QByteArray payload(reinterpret_cast<const char*>(bytes.data()), static_cast<qsizetype>(bytes.size()));
    QMetaObject::invokeMethod(
        socket.data(),
        [socket, payload]() {
            if (!socket) {
                return;
            }
            socket->sendBinaryMessage(payload);
        },
        Qt::QueuedConnection);
}

void QtClientTransport::Close() {
    QPointer<QWebSocket> socket = socket_;
    if (!socket) {
        return;
    }
    QMetaObject::invokeMethod(
        socket.data(),
        [socket]() {
            if (!socket) {
                return;
            }
            socket->close(QWebSocketProtocol::CloseCodeNormal);
        },
        Qt::QueuedConnection);
}

RelayServer::RelayServer(
    RelayConfig config,
    const FunctionDispatcher& dispatcher,
    UpstreamFactory upstream_factory,
    std::function<std::string(const std::string& theme)> build_system_instruction,
    QObject* parent)
    : QObject(parent),
      config_(std::move(config)),
      dispatcher_(dispatcher),
      upstream_factory_(std::move(upstream_factory)),
      build_system_instruction_(std::move(build_system_instruction)),
      server_(QStringLiteral("vox-relay"), QWebSocketServer::NonSecureMode) {
    connect(&server_, &QWebSocketServer::newConnection, this, &RelayServer::OnNewConnection);
}

RelayServer::~RelayServer() {
    Close();
}

void RelayServer::SetLogger(LogFn logger) {
    logger_ = std::move(logger);
}

bool RelayServer::Listen(std::string* error) {
    QHostAddress address;
    if (!address.setAddress(QString::fromStdString(config_.listen_address))) {
        if (error) *error = "invalid listen address " + config_.listen_address;
        return false;
    }
    if (!server_.listen(address, static_cast<quint16>(config_.listen_port))) {
        if (error) *error = server_.errorString().toStdString();
        return false;
    }
    std::ostringstream oss;
    oss << "relay listening address=" << config_.listen_address << " port=" << server_.serverPort()
        << " path=" << config_.listen_path;
    Log(oss.str());
    return true;
}

void RelayServer::Close() {
    while (!endpoints_.empty()) {
        ReleaseEndpoint(endpoints_.begin()->first);
    }
    if (server_.isListening()) {
        server_.close();
        Log("relay stopped");
    }
}

quint16 RelayServer::port() const {
    return server_.serverPort();
}

void RelayServer::OnNewConnection() {
    while (server_.hasPendingConnections()) {
        QWebSocket* socket = server_.nextPendingConnection();
        if (!socket) {
            continue;
        }
        const std::string path = socket->requestUrl().path().toStdString();
        if (!config_.listen_path.empty() && path != config_.listen_path) {
            Log("connection rejected path=" + path);
            socket->close(QWebSocketProtocol::CloseCodePolicyViolated, QStringLiteral("unknown path"));
            socket->deleteLater();
            continue;
        }
        if (static_cast<int>(endpoints_.size()) >= config_.max_sessions) {
            RejectConnection(socket, SessionErrorKind::UpstreamUnavailable, "Relay at session capacity");
            continue;
        }

        EndpointSettings settings;
        settings.api_key = config_.api_key;
        settings.model = config_.model;
        settings.upstream_url = config_.upstream_url;
        settings.build_system_instruction = build_system_instruction_;

        auto endpoint = std::make_unique<RelayEndpoint>(
            std::make_shared<QtClientTransport>(socket), dispatcher_, upstream_factory_, std::move(settings));
        endpoint->SetLogger(logger_);
        RelayEndpoint* ep = endpoint.get();
        endpoints_.emplace(socket, std::move(endpoint));

        connect(socket, &QWebSocket::textMessageReceived, this, [ep](const QString& message) {
            ep->HandleTextFrame(message.toStdString());
        });
        connect(socket, &QWebSocket::binaryMessageReceived, this, [ep](const QByteArray& message) {
            ep->HandleBinaryFrame(
                reinterpret_cast<const std::uint8_t*>(message.constData()), static_cast<std::size_t>(message.size()));
        });
        connect(socket, &QWebSocket::disconnected, this, [this, socket]() { ReleaseEndpoint(socket); });

        std::ostringstream oss;
        oss << "client connected peer=" << socket->peerAddress().toString().toStdString()
            << " sessions=" << endpoints_.size();
        Log(oss.str());
    }
}

void RelayServer::RejectConnection(QWebSocket* socket, SessionErrorKind kind, const std::string& message) {
    Log("connection rejected reason=" + message);
    socket->sendTextMessage(QString::fromStdString(BuildErrorMessage(kind, message)));
    socket->sendTextMessage(QString::fromStdString(BuildSessionEndMessage(CloseReason::Error)));
    socket->close(QWebSocketProtocol::CloseCodeTryAgainLater);
    socket->deleteLater();
}

void RelayServer::ReleaseEndpoint(QWebSocket* socket) {
    const auto it = endpoints_.find(socket);
    if (it == endpoints_.end()) {
        return;
    }
    std::unique_ptr<RelayEndpoint> endpoint = std::move(it->second);
    endpoints_.erase(it);
    // Joins the session worker before the socket goes away.
    endpoint->OnTransportClosed();
    endpoint.reset();
    QObject::disconnect(socket, nullptr, this, nullptr);
    if (socket->state() != QAbstractSocket::UnconnectedState) {
        socket->close();
    }
    socket->deleteLater();

    std::ostringstream oss;
    oss << "client released sessions=" << endpoints_.size();
    Log(oss.str());
}

void RelayServer::Log(const std::string& msg) const {
    if (logger_) {
        logger_(msg);
    }
}

} // namespace voxrelay

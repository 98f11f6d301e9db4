#include "gemini_live_connection.h"

#include "gemini_live_protocol.h"

#include <QEventLoop>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>
#include <QUrlQuery>
#include <QWebSocket>
#include <QWebSocketProtocol>

#include <chrono>
#include <sstream>
#include <utility>

namespace voxrelay {

namespace {
constexpr int kConnectTimeoutMs = 10000;
constexpr int kSetupTimeoutMs = 10000;
constexpr int kHandshakePollMs = 100;
} // namespace

GeminiLiveConnection::GeminiLiveConnection() = default;

GeminiLiveConnection::~GeminiLiveConnection() {
    Close();
}

void GeminiLiveConnection::SetLogger(LogFn logger) {
    logger_ = std::move(logger);
}

bool GeminiLiveConnection::Open(const UpstreamSetup& setup, const ContinueFn& should_continue, std::string* error) {
    if (socket_) {
        if (error) *error = "already_open";
        return false;
    }
    setup_complete_ = false;
    disconnected_ = false;
    error_reported_ = false;
    close_error_.clear();
    pending_events_.clear();

    // The loop must exist before the socket so this thread gets an event dispatcher.
    loop_ = std::make_unique<QEventLoop>();
    timer_ = std::make_unique<QTimer>();
    timer_->setSingleShot(true);
    QObject::connect(timer_.get(), &QTimer::timeout, loop_.get(), &QEventLoop::quit);

    socket_ = std::make_unique<QWebSocket>();
    QWebSocket* ws = socket_.get();
    QObject::connect(ws, &QWebSocket::textMessageReceived, ws, [this](const QString& message) {
        HandleMessage(message.toUtf8());
    });
    QObject::connect(ws, &QWebSocket::binaryMessageReceived, ws, [this](const QByteArray& message) {
        HandleMessage(message);
    });
    QObject::connect(ws, &QWebSocket::errorOccurred, ws, [this, ws](QAbstractSocket::SocketError) {
        if (close_error_.empty()) {
            close_error_ = ws->errorString().toStdString();
        }
    });
    QObject::connect(ws, &QWebSocket::disconnected, ws, [this, ws]() {
        disconnected_ = true;
        const auto code = ws->closeCode();
        if (close_error_.empty() && code != QWebSocketProtocol::CloseCodeNormal) {
            std::ostringstream oss;
            oss << "close_code=" << static_cast<int>(code) << " reason=" << ws->closeReason().toStdString();
            close_error_ = oss.str();
        }
    });
    QObject::connect(ws, &QWebSocket::textMessageReceived, loop_.get(), &QEventLoop::quit);
    QObject::connect(ws, &QWebSocket::binaryMessageReceived, loop_.get(), &QEventLoop::quit);
    QObject::connect(ws, &QWebSocket::connected, loop_.get(), &QEventLoop::quit);
    QObject::connect(ws, &QWebSocket::disconnected, loop_.get(), &QEventLoop::quit);

    QUrl url(QString::fromStdString(setup.url.empty() ? kDefaultUpstreamUrl : setup.url));
    if (!setup.api_key.empty()) {
        QUrlQuery query(url);
        query.addQueryItem(QStringLiteral("key"), QString::fromStdString(setup.api_key));
        url.setQuery(query);
    }
    {
        std::ostringstream oss;
        oss << "upstream connecting host=" << url.host().toStdString() << " model=" << setup.model
            << " voice=" << setup.voice << " resuming=" << (setup.resume_handle.empty() ? "false" : "true");
        Log(oss.str());
    }
    ws->open(QNetworkRequest(url));

    const auto connect_deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(kConnectTimeoutMs);
    while (ws->state() != QAbstractSocket::ConnectedState) {
        if (should_continue && !should_continue()) {
            if (error) *error = "canceled";
            Close();
            return false;
        }
        if (disconnected_ || std::chrono::steady_clock::now() >= connect_deadline) {
            if (error) {
                *error = close_error_.empty() ? "connect_timeout" : "connect_failed " + close_error_;
            }
            Close();
            return false;
        }
        PumpEvents(kHandshakePollMs);
    }

    if (!SendJson(BuildSetupMessage(setup))) {
        if (error) *error = "setup_send_failed";
        Close();
        return false;
    }

    const auto setup_deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(kSetupTimeoutMs);
    while (!setup_complete_) {
        if (should_continue && !should_continue()) {
            if (error) *error = "canceled";
            Close();
            return false;
        }
        if (disconnected_ || std::chrono::steady_clock::now() >= setup_deadline) {
            if (error) {
                *error = close_error_.empty() ? "setup_timeout" : "setup_rejected " + close_error_;
            }
            Close();
            return false;
        }
        PumpEvents(kHandshakePollMs);
    }
    Log("upstream setup complete");
    return true;
}

UpstreamConnection::ReadResult GeminiLiveConnection::TryReadEvent(UpstreamEvent* out, int timeout_ms) {
    if (!out) {
        return ReadResult::Timeout;
    }
    auto take_ready = [this, out](ReadResult* result) {
        if (!pending_events_.empty()) {
            *out = std::move(pending_events_.front());
            pending_events_.pop_front();
            *result = ReadResult::Event;
            return true;
        }
        if (disconnected_ || !socket_) {
            if (!close_error_.empty() && !error_reported_) {
                error_reported_ = true;
                *out = UpstreamError{close_error_};
                *result = ReadResult::Event;
                return true;
            }
            *result = ReadResult::Disconnected;
            return true;
        }
        return false;
    };

    ReadResult result = ReadResult::Timeout;
    if (take_ready(&result)) {
        return result;
    }
    PumpEvents(timeout_ms);
    if (take_ready(&result)) {
        return result;
    }
    return ReadResult::Timeout;
}

bool GeminiLiveConnection::SendAudio(const AudioFrame& frame) {
    if (frame.empty()) {
        return true;
    }
    return SendJson(BuildRealtimeAudioMessage(frame));
}

bool GeminiLiveConnection::SendText(const std::string& text) {
    return SendJson(BuildClientTextMessage(text));
}

bool GeminiLiveConnection::SendToolResponses(const std::vector<ToolResult>& results) {
    if (results.empty()) {
        return true;
    }
    return SendJson(BuildToolResponseMessage(results));
}

void GeminiLiveConnection::Close() {
    if (socket_) {
        QObject::disconnect(socket_.get(), nullptr, nullptr, nullptr);
        if (socket_->state() == QAbstractSocket::ConnectedState) {
            socket_->close(QWebSocketProtocol::CloseCodeNormal);
        } else {
            socket_->abort();
        }
        socket_.reset();
        disconnected_ = true;
        Log("upstream closed");
    }
    timer_.reset();
    loop_.reset();
}

bool GeminiLiveConnection::SendJson(const std::string& json) {
    if (!socket_ || disconnected_ || socket_->state() != QAbstractSocket::ConnectedState) {
        return false;
    }
    const qint64 sent = socket_->sendTextMessage(QString::fromStdString(json));
    if (sent <= 0) {
        Log("upstream send failed bytes=" + std::to_string(json.size()));
        return false;
    }
    return true;
}

void GeminiLiveConnection::PumpEvents(int timeout_ms) {
    if (!loop_ || !timer_) {
        return;
    }
    timer_->start(timeout_ms > 0 ? timeout_ms : 0);
    loop_->exec();
    timer_->stop();
}

void GeminiLiveConnection::HandleMessage(const QByteArray& payload) {
    DecodedServerMessage decoded;
    std::string error;
    if (!DecodeServerMessage(payload, &decoded, &error)) {
        Log("upstream message dropped " + error);
        return;
    }
    if (decoded.setup_complete) {
        setup_complete_ = true;
    }
    for (auto& ev : decoded.events) {
        pending_events_.push_back(std::move(ev));
    }
}

void GeminiLiveConnection::Log(const std::string& msg) const {
    if (logger_) {
        logger_(msg);
    }
}

} // namespace voxrelay

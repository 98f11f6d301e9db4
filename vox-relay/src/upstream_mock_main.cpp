#include "audio_codec.h"
#include "relay_config.h"
#include "relay_log.h"

#include <QByteArray>
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QHostAddress>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QMetaObject>
#include <QPointer>
#include <QWebSocket>
#include <QWebSocketServer>

#include <atomic>
#include <cmath>
#include <cstdint>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace {

constexpr quint16 kDefaultMockPort = 9765;
constexpr const char* kOutboundMimeType = "audio/pcm;rate=24000";
constexpr int kToneMs = 400;
constexpr double kToneHz = 440.0;
constexpr double kToneAmplitude = 0.2;
constexpr double kPi = 3.14159265358979323846;

std::string NewMockId(const char* prefix) {
    static std::atomic<std::uint64_t> seq{1};
    std::ostringstream oss;
    oss << prefix << "-" << seq.fetch_add(1);
    return oss.str();
}

QString Compact(const QJsonObject& obj) {
    return QString::fromUtf8(QJsonDocument(obj).toJson(QJsonDocument::Compact));
}

// 16 kHz mic audio stretched to the 24 kHz output rate by linear interpolation.
std::vector<std::int16_t> Upsample16To24(const std::vector<std::int16_t>& in) {
    std::vector<std::int16_t> out;
    if (in.empty()) {
        return out;
    }
    const std::size_t out_count = in.size() * 3 / 2;
    out.reserve(out_count);
    for (std::size_t i = 0; i < out_count; ++i) {
        const double pos = static_cast<double>(i) * 2.0 / 3.0;
        const std::size_t idx = static_cast<std::size_t>(pos);
        const double frac = pos - static_cast<double>(idx);
        const double a = in[idx];
        const double b = idx + 1 < in.size() ? in[idx + 1] : in[idx];
        out.push_back(static_cast<std::int16_t>(std::lround(a + (b - a) * frac)));
    }
    return out;
}

std::vector<std::int16_t> MakeTone() {
    const std::size_t count = static_cast<std::size_t>(voxrelay::kOutboundSampleRate) * kToneMs / 1000;
    std::vector<float> samples(count);
    for (std::size_t i = 0; i < count; ++i) {
        samples[i] = static_cast<float>(
            kToneAmplitude * std::sin(2.0 * kPi * kToneHz * static_cast<double>(i) / voxrelay::kOutboundSampleRate));
    }
    return voxrelay::FloatToPcm16(samples.data(), samples.size());
}

QJsonObject AudioPart(const std::vector<std::int16_t>& samples) {
    const std::vector<std::uint8_t> bytes = voxrelay::EncodePcm16Le(samples.data(), samples.size());
    const QByteArray raw(reinterpret_cast<const char*>(bytes.data()), static_cast<qsizetype>(bytes.size()));
    QJsonObject inline_data;
    inline_data.insert(QStringLiteral("mimeType"), QString::fromUtf8(kOutboundMimeType));
    inline_data.insert(QStringLiteral("data"), QString::fromLatin1(raw.toBase64()));
    QJsonObject part;
    part.insert(QStringLiteral("inlineData"), inline_data);
    return part;
}

QJsonObject ServerContent(const QJsonObject& content) {
    QJsonObject msg;
    msg.insert(QStringLiteral("serverContent"), content);
    return msg;
}

// Minimal stand-in for the live model: accepts one relay connection at a time,
// answers setup, echoes audio and text turns, and lets the operator inject tool
// calls, go-away notices and resumption updates.
class MockUpstream {
public:
    using LogFn = voxrelay::LogFn;

    MockUpstream()
        : server_(QStringLiteral("vox-mock-upstream"), QWebSocketServer::NonSecureMode) {
        QObject::connect(&server_, &QWebSocketServer::newConnection, &server_, [this]() { OnNewConnection(); });
    }

    ~MockUpstream() {
        Stop();
    }

    void SetLogger(LogFn logger) {
        logger_ = std::move(logger);
    }

    bool Start(const QHostAddress& address, quint16 port) {
        if (!server_.listen(address, port)) {
            Log("listen failed " + server_.errorString().toStdString());
            return false;
        }
        std::ostringstream oss;
        oss << "listening port=" << server_.serverPort();
        Log(oss.str());
        return true;
    }

    void Stop() {
        DropSession();
        if (server_.isListening()) {
            server_.close();
            Log("stopped");
        }
    }

    void SetEcho(bool echo) {
        echo_ = echo;
        Log(echo ? "audio echo on" : "audio echo off");
    }

    void DropSession() {
        if (!session_) {
            return;
        }
        QObject::disconnect(session_.data(), nullptr, nullptr, nullptr);
        session_->abort();
        session_->deleteLater();
        session_.clear();
        Log("session dropped");
    }

    void CloseSession() {
        if (!session_) {
            Log("close ignored (no active session)");
            return;
        }
        session_->close(QWebSocketProtocol::CloseCodeNormal);
        Log("session closed cleanly");
    }

    void SendToolCall(const std::string& name, const std::string& args_json) {
        QJsonObject args;
        if (!args_json.empty()) {
            QJsonParseError parse_error;
            const QJsonDocument doc = QJsonDocument::fromJson(QByteArray::fromStdString(args_json), &parse_error);
            if (parse_error.error != QJsonParseError::NoError || !doc.isObject()) {
                Log("tool args must be a JSON object");
                return;
            }
            args = doc.object();
        }
        QJsonObject call;
        const std::string id = NewMockId("call");
        call.insert(QStringLiteral("id"), QString::fromStdString(id));
        call.insert(QStringLiteral("name"), QString::fromStdString(name));
        call.insert(QStringLiteral("args"), args);
        QJsonObject tool_call;
        tool_call.insert(QStringLiteral("functionCalls"), QJsonArray{call});
        QJsonObject msg;
        msg.insert(QStringLiteral("toolCall"), tool_call);
        Send(msg, "toolCall id=" + id + " name=" + name);
    }

    void SendGoAway(double seconds) {
        std::ostringstream time_left;
        time_left << seconds << "s";
        QJsonObject go_away;
        go_away.insert(QStringLiteral("timeLeft"), QString::fromStdString(time_left.str()));
        QJsonObject msg;
        msg.insert(QStringLiteral("goAway"), go_away);
        Send(msg, "goAway timeLeft=" + time_left.str());
    }

    void SendResumption(const std::string& handle) {
        QJsonObject update;
        update.insert(QStringLiteral("newHandle"), QString::fromStdString(handle));
        update.insert(QStringLiteral("resumable"), true);
        QJsonObject msg;
        msg.insert(QStringLiteral("sessionResumptionUpdate"), update);
        Send(msg, "sessionResumptionUpdate handle=" + handle);
    }

    void SendInterrupted() {
        QJsonObject content;
        content.insert(QStringLiteral("interrupted"), true);
        Send(ServerContent(content), "interrupted");
    }

    void Say(const std::string& text) {
        QJsonObject transcription;
        transcription.insert(QStringLiteral("text"), QString::fromStdString(text));
        QJsonObject model_turn;
        model_turn.insert(QStringLiteral("parts"), QJsonArray{AudioPart(MakeTone())});
        QJsonObject content;
        content.insert(QStringLiteral("modelTurn"), model_turn);
        content.insert(QStringLiteral("outputTranscription"), transcription);
        Send(ServerContent(content), "say text=" + text);

        QJsonObject done;
        done.insert(QStringLiteral("turnComplete"), true);
        Send(ServerContent(done), "turnComplete");
    }

private:
    void OnNewConnection() {
        while (QWebSocket* socket = server_.nextPendingConnection()) {
            if (session_) {
                Log("rejecting second connection");
                socket->close(QWebSocketProtocol::CloseCodeTryAgainLater);
                socket->deleteLater();
                continue;
            }
            session_ = socket;
            audio_chunks_ = 0;
            setup_done_ = false;
            QObject::connect(socket, &QWebSocket::textMessageReceived, socket, [this](const QString& message) {
                OnMessage(message.toUtf8());
            });
            QObject::connect(socket, &QWebSocket::binaryMessageReceived, socket, [this](const QByteArray& payload) {
                OnMessage(payload);
            });
            QObject::connect(socket, &QWebSocket::disconnected, socket, [this, socket]() {
                std::ostringstream oss;
                oss << "session disconnected audio_chunks=" << audio_chunks_;
                Log(oss.str());
                if (session_ == socket) {
                    session_.clear();
                }
                socket->deleteLater();
            });
            Log("session connected path=" + socket->requestUrl().path().toStdString());
        }
    }

    void OnMessage(const QByteArray& payload) {
        QJsonParseError parse_error;
        const QJsonDocument doc = QJsonDocument::fromJson(payload, &parse_error);
        if (parse_error.error != QJsonParseError::NoError || !doc.isObject()) {
            Log("rx malformed frame len=" + std::to_string(payload.size()));
            return;
        }
        const QJsonObject msg = doc.object();

        if (msg.contains(QStringLiteral("setup"))) {
            const QJsonObject setup = msg.value(QStringLiteral("setup")).toObject();
            const QJsonArray tools = setup.value(QStringLiteral("tools")).toArray();
            const QJsonArray declarations =
                tools.isEmpty() ? QJsonArray() : tools.at(0).toObject().value(QStringLiteral("functionDeclarations")).toArray();
            const QString voice = setup.value(QStringLiteral("generationConfig"))
                                      .toObject()
                                      .value(QStringLiteral("speechConfig"))
                                      .toObject()
                                      .value(QStringLiteral("voiceConfig"))
                                      .toObject()
                                      .value(QStringLiteral("prebuiltVoiceConfig"))
                                      .toObject()
                                      .value(QStringLiteral("voiceName"))
                                      .toString();
            const bool resumed = !setup.value(QStringLiteral("sessionResumption"))
                                      .toObject()
                                      .value(QStringLiteral("handle"))
                                      .toString()
                                      .isEmpty();
            std::ostringstream oss;
            oss << "rx setup model=" << setup.value(QStringLiteral("model")).toString().toStdString()
                << " voice=" << voice.toStdString() << " tools=" << declarations.size()
                << " resumed=" << (resumed ? "true" : "false");
            Log(oss.str());
            setup_done_ = true;
            QJsonObject reply;
            reply.insert(QStringLiteral("setupComplete"), QJsonObject());
            Send(reply, "setupComplete");
            return;
        }
        if (!setup_done_) {
            Log("rx message before setup ignored");
            return;
        }

        if (msg.contains(QStringLiteral("realtimeInput"))) {
            const QJsonObject audio =
                msg.value(QStringLiteral("realtimeInput")).toObject().value(QStringLiteral("audio")).toObject();
            const QByteArray raw = QByteArray::fromBase64(audio.value(QStringLiteral("data")).toString().toLatin1());
            ++audio_chunks_;
            if (audio_chunks_ == 1 || audio_chunks_ % 50 == 0) {
                std::ostringstream oss;
                oss << "audio rx chunks=" << audio_chunks_ << " bytes=" << raw.size();
                Log(oss.str());
            }
            if (echo_) {
                const std::vector<std::int16_t> samples =
                    voxrelay::DecodePcm16Le(reinterpret_cast<const std::uint8_t*>(raw.constData()), static_cast<std::size_t>(raw.size()));
                QJsonObject model_turn;
                model_turn.insert(QStringLiteral("parts"), QJsonArray{AudioPart(Upsample16To24(samples))});
                QJsonObject content;
                content.insert(QStringLiteral("modelTurn"), model_turn);
                Send(ServerContent(content), std::string());
            }
            return;
        }

        if (msg.contains(QStringLiteral("clientContent"))) {
            const QJsonArray turns = msg.value(QStringLiteral("clientContent")).toObject().value(QStringLiteral("turns")).toArray();
            std::string text;
            for (const QJsonValue& turn : turns) {
                for (const QJsonValue& part : turn.toObject().value(QStringLiteral("parts")).toArray()) {
                    text += part.toObject().value(QStringLiteral("text")).toString().toStdString();
                }
            }
            Log("rx clientContent text=" + text);
            QJsonObject heard;
            heard.insert(QStringLiteral("text"), QString::fromStdString(text));
            QJsonObject content;
            content.insert(QStringLiteral("inputTranscription"), heard);
            Send(ServerContent(content), "inputTranscription");
            Say("You said: " + text);
            return;
        }

        if (msg.contains(QStringLiteral("toolResponse"))) {
            const QJsonArray responses =
                msg.value(QStringLiteral("toolResponse")).toObject().value(QStringLiteral("functionResponses")).toArray();
            for (const QJsonValue& value : responses) {
                const QJsonObject response = value.toObject();
                Log("rx toolResponse id=" + response.value(QStringLiteral("id")).toString().toStdString() +
                    " name=" + response.value(QStringLiteral("name")).toString().toStdString() + " response=" +
                    Compact(response.value(QStringLiteral("response")).toObject()).toStdString());
            }
            return;
        }

        Log("rx unhandled message " + Compact(msg).left(120).toStdString());
    }

    void Send(const QJsonObject& msg, const std::string& label) {
        if (!session_) {
            if (!label.empty()) {
                Log(label + " ignored (no active session)");
            }
            return;
        }
        session_->sendTextMessage(Compact(msg));
        if (!label.empty()) {
            Log("tx " + label);
        }
    }

    void Log(const std::string& msg) const {
        if (logger_) {
            logger_(msg);
        }
    }

    LogFn logger_;
    QWebSocketServer server_;
    QPointer<QWebSocket> session_;
    bool setup_done_ = false;
    bool echo_ = true;
    std::uint64_t audio_chunks_ = 0;
};

template <typename Fn>
void Post(QCoreApplication& app, Fn fn) {
    QMetaObject::invokeMethod(&app, fn, Qt::QueuedConnection);
}

void CommandLoop(QCoreApplication& app, MockUpstream& mock) {
    std::string line;
    while (std::getline(std::cin, line)) {
        std::istringstream iss(line);
        std::string cmd;
        iss >> cmd;
        if (cmd.empty()) {
            continue;
        }
        if (cmd == "tool") {
            std::string name;
            iss >> name;
            std::string args;
            std::getline(iss, args);
            const std::size_t first = args.find_first_not_of(' ');
            args = first == std::string::npos ? std::string() : args.substr(first);
            if (name.empty()) {
                std::cout << "usage: tool <name> [json-args]\n";
                continue;
            }
            Post(app, [&mock, name, args]() { mock.SendToolCall(name, args); });
        } else if (cmd == "goaway") {
            double seconds = 5.0;
            iss >> seconds;
            if (seconds < 0) {
                seconds = 0;
            }
            Post(app, [&mock, seconds]() { mock.SendGoAway(seconds); });
        } else if (cmd == "resume") {
            std::string handle;
            iss >> handle;
            if (handle.empty()) {
                handle = NewMockId("handle");
            }
            Post(app, [&mock, handle]() { mock.SendResumption(handle); });
        } else if (cmd == "say") {
            std::string text;
            std::getline(iss, text);
            Post(app, [&mock, text]() { mock.Say(text.empty() ? std::string("hello") : text.substr(1)); });
        } else if (cmd == "interrupt") {
            Post(app, [&mock]() { mock.SendInterrupted(); });
        } else if (cmd == "echo") {
            std::string mode;
            iss >> mode;
            const bool on = mode != "off";
            Post(app, [&mock, on]() { mock.SetEcho(on); });
        } else if (cmd == "close") {
            Post(app, [&mock]() { mock.CloseSession(); });
        } else if (cmd == "drop") {
            Post(app, [&mock]() { mock.DropSession(); });
        } else if (cmd == "quit" || cmd == "exit") {
            break;
        } else {
            std::cout << "unknown command\n";
        }
    }
    Post(app, [&app]() { app.quit(); });
}

} // namespace

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("vox_relay_upstream_mock"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Local stand-in for the live model endpoint"));
    parser.addHelpOption();
    const QCommandLineOption port_opt(
        {QStringLiteral("p"), QStringLiteral("port")}, QStringLiteral("Listen port."), QStringLiteral("port"),
        QString::number(kDefaultMockPort));
    const QCommandLineOption verbose_opt({QStringLiteral("v"), QStringLiteral("verbose")}, QStringLiteral("Log every audio chunk."));
    parser.addOptions({port_opt, verbose_opt});
    parser.process(app);

    int port = 0;
    if (!voxrelay::TryParsePort(parser.value(port_opt).toStdString(), &port)) {
        std::cerr << "vox_relay_upstream_mock: invalid --port " << parser.value(port_opt).toStdString() << "\n";
        return 2;
    }

    MockUpstream mock;
    mock.SetLogger(voxrelay::MakeConsoleLogger("mock-upstream", parser.isSet(verbose_opt)));
    if (!mock.Start(QHostAddress::LocalHost, static_cast<quint16>(port))) {
        return 1;
    }

    std::cout << "Point the relay at it: VOXRELAY_UPSTREAM_URL=ws://127.0.0.1:" << port << " GEMINI_API_KEY=dummy\n";
    std::cout << "Commands: tool <name> [json-args], goaway [seconds], resume [handle], say [text], interrupt, "
                 "echo on|off, close, drop, quit\n";

    std::thread commands(CommandLoop, std::ref(app), std::ref(mock));
    const int rc = app.exec();
    mock.Stop();
    if (commands.joinable()) {
        commands.join();
    }
    return rc;
}

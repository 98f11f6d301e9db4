#include "relay_config.h"
#include "relay_log.h"
#include "voice_client.h"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QMetaObject>
#include <QUrl>

#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

namespace {

QString DefaultRelayUrl() {
    std::ostringstream oss;
    oss << "ws://127.0.0.1:" << voxrelay::kDefaultListenPort << voxrelay::kDefaultListenPath;
    return QString::fromStdString(oss.str());
}

std::string ArgAfter(const std::string& line, const std::string& command) {
    if (line.size() <= command.size() + 1) {
        return std::string();
    }
    return line.substr(command.size() + 1);
}

// Runs `fn` on the Qt main thread, where the client lives.
template <typename Fn>
void Post(QCoreApplication& app, Fn fn) {
    QMetaObject::invokeMethod(&app, fn, Qt::QueuedConnection);
}

void CommandLoop(QCoreApplication& app, voxrelay::VoiceClient& client, std::string default_theme) {
    std::string line;
    while (true) {
        if (!std::getline(std::cin, line)) {
            break;
        }
        if (line == "start" || line.rfind("start ", 0) == 0) {
            std::string theme = ArgAfter(line, "start");
            if (theme.empty()) {
                theme = default_theme;
            }
            Post(app, [&client, theme]() { client.Start(theme); });
        } else if (line == "mute") {
            Post(app, [&client]() { client.SetMuted(true); });
        } else if (line == "unmute") {
            Post(app, [&client]() { client.SetMuted(false); });
        } else if (line.rfind("text ", 0) == 0) {
            const std::string content = ArgAfter(line, "text");
            if (content.empty()) {
                std::cout << "usage: text <message>\n";
                continue;
            }
            Post(app, [&client, content]() { client.SendText(content); });
        } else if (line == "end") {
            Post(app, [&client]() { client.End(); });
        } else if (line == "status") {
            Post(app, [&client]() { std::cout << "status " << client.Describe() << std::endl; });
        } else if (line == "quit" || line == "exit") {
            break;
        } else if (line.empty()) {
            continue;
        } else {
            std::cout << "unknown command\n";
        }
    }
    Post(app, [&app]() { app.quit(); });
}

} // namespace

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("vox_relay_client"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Voice client for the vox relay"));
    parser.addHelpOption();
    const QCommandLineOption url_opt(
        {QStringLiteral("u"), QStringLiteral("url")}, QStringLiteral("Relay WebSocket URL."), QStringLiteral("url"),
        DefaultRelayUrl());
    const QCommandLineOption theme_opt(
        {QStringLiteral("t"), QStringLiteral("theme")}, QStringLiteral("Default theme for start."),
        QStringLiteral("theme"), QString::fromUtf8(voxrelay::kDefaultTheme));
    const QCommandLineOption no_audio_opt(
        QStringLiteral("no-audio"), QStringLiteral("Drive the control protocol without audio devices."));
    const QCommandLineOption verbose_opt({QStringLiteral("v"), QStringLiteral("verbose")}, QStringLiteral("Verbose logging."));
    parser.addOptions({url_opt, theme_opt, no_audio_opt, verbose_opt});
    parser.process(app);

    const QUrl url(parser.value(url_opt));
    if (!url.isValid() || (url.scheme() != QLatin1String("ws") && url.scheme() != QLatin1String("wss"))) {
        std::cerr << "vox_relay_client: invalid --url " << parser.value(url_opt).toStdString() << "\n";
        return 2;
    }
    const bool verbose = parser.isSet(verbose_opt) || voxrelay::IsEnvEnabled("VOXRELAY_VERBOSE");
    const voxrelay::LogFn log = voxrelay::MakeConsoleLogger("vox-client", verbose);

    voxrelay::VoiceClient::Callbacks callbacks;
    callbacks.on_ready = [log](const std::string& session_id, const std::string& voice) {
        log("ready session_id=" + session_id + " voice=" + voice);
    };
    callbacks.on_transcript = [log](const std::string& role, const std::string& text) { log(role + ": " + text); };
    callbacks.on_tool_event = [log](const std::string& line) { log("tool " + line); };
    callbacks.on_error = [log](const std::string& code, const std::string& message) {
        log("error code=" + code + " message=" + message);
    };
    callbacks.on_session_end = [log](const std::string& reason) { log("session ended reason=" + reason); };
    callbacks.on_speaking_changed = [log, verbose](bool speaking) {
        if (verbose) {
            log(speaking ? "assistant speaking" : "assistant quiet");
        }
    };

    voxrelay::VoiceClient client(url, callbacks);
    client.SetLogger(log);
    client.SetAudioEnabled(!parser.isSet(no_audio_opt));

    std::cout << "vox relay client url=" << url.toString().toStdString() << "\n";
    std::cout << "Commands: start [theme], mute, unmute, text <message>, end, status, quit\n";

    std::thread commands(CommandLoop, std::ref(app), std::ref(client), parser.value(theme_opt).toStdString());
    const int rc = app.exec();
    client.Close();
    if (commands.joinable()) {
        commands.join();
    }
    return rc;
}

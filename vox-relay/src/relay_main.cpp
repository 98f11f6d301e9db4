#include "relay_config.h"
#include "relay_runtime.h"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>

#include <iostream>
#include <string>

namespace {

struct Options {
    QCommandLineOption address{QStringLiteral("address"), QStringLiteral("Listen address."), QStringLiteral("host")};
    QCommandLineOption port{{QStringLiteral("p"), QStringLiteral("port")}, QStringLiteral("Listen port."), QStringLiteral("port")};
    QCommandLineOption path{QStringLiteral("path"), QStringLiteral("WebSocket path clients connect to."), QStringLiteral("path")};
    QCommandLineOption max_sessions{
        QStringLiteral("max-sessions"), QStringLiteral("Concurrent session limit."), QStringLiteral("count")};
    QCommandLineOption model{QStringLiteral("model"), QStringLiteral("Upstream live model."), QStringLiteral("name")};
    QCommandLineOption upstream_url{
        QStringLiteral("upstream-url"), QStringLiteral("Upstream WebSocket URL."), QStringLiteral("url")};
    QCommandLineOption catalog{QStringLiteral("catalog"), QStringLiteral("Tool catalog JSON file."), QStringLiteral("file")};
    QCommandLineOption project_state{
        QStringLiteral("project-state"), QStringLiteral("Project snapshot JSON file."), QStringLiteral("file")};
    QCommandLineOption verbose{{QStringLiteral("v"), QStringLiteral("verbose")}, QStringLiteral("Log per-frame audio activity.")};
};

bool ApplyOptions(const QCommandLineParser& parser, const Options& opts, voxrelay::RelayConfig* config, std::string* error) {
    if (parser.isSet(opts.address)) {
        config->listen_address = parser.value(opts.address).toStdString();
    }
    if (parser.isSet(opts.port)) {
        int port = 0;
        if (!voxrelay::TryParsePort(parser.value(opts.port).toStdString(), &port)) {
            *error = "invalid --port " + parser.value(opts.port).toStdString();
            return false;
        }
        config->listen_port = port;
    }
    if (parser.isSet(opts.path)) {
        config->listen_path = parser.value(opts.path).toStdString();
    }
    if (parser.isSet(opts.max_sessions)) {
        bool ok = false;
        const int value = parser.value(opts.max_sessions).toInt(&ok);
        if (!ok || value <= 0) {
            *error = "invalid --max-sessions " + parser.value(opts.max_sessions).toStdString();
            return false;
        }
        config->max_sessions = value;
    }
    if (parser.isSet(opts.model)) {
        config->model = parser.value(opts.model).toStdString();
    }
    if (parser.isSet(opts.upstream_url)) {
        config->upstream_url = parser.value(opts.upstream_url).toStdString();
    }
    if (parser.isSet(opts.catalog)) {
        config->catalog_path = parser.value(opts.catalog).toStdString();
    }
    if (parser.isSet(opts.project_state)) {
        config->project_state_path = parser.value(opts.project_state).toStdString();
    }
    if (parser.isSet(opts.verbose)) {
        config->verbose = true;
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("vox_relay_server"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Real-time voice session relay"));
    parser.addHelpOption();
    Options opts;
    parser.addOptions({opts.address, opts.port, opts.path, opts.max_sessions, opts.model, opts.upstream_url,
                       opts.catalog, opts.project_state, opts.verbose});
    parser.process(app);

    voxrelay::RelayConfig config = voxrelay::LoadRelayConfigFromEnv();
    std::string error;
    if (!ApplyOptions(parser, opts, &config, &error)) {
        std::cerr << "vox_relay_server: " << error << "\n";
        return 2;
    }

    voxrelay::RelayRuntime runtime(config);
    if (!runtime.Start(&error)) {
        std::cerr << "vox_relay_server: listen failed: " << error << "\n";
        return 1;
    }

    const int rc = app.exec();
    runtime.Stop();
    return rc;
}

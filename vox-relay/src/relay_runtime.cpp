#include "relay_runtime.h"

#include "gemini_live_connection.h"
#include "relay_log.h"
#include "studio_tools.h"

#include <sstream>
#include <utility>
#include <vector>

namespace voxrelay {

RelayRuntime::RelayRuntime(RelayConfig config)
    : config_(std::move(config)) {
    logger_ = MakeConsoleLogger("vox-relay", config_.verbose);
}

RelayRuntime::~RelayRuntime() {
    Stop();
}

bool RelayRuntime::Start(std::string* error) {
    if (server_) {
        Log("already running");
        return true;
    }
    Log("starting " + DescribeConfig(config_));

    std::vector<CatalogEntry> catalog;
    std::string catalog_error;
    if (!LoadCatalogFile(config_.catalog_path, &catalog, &catalog_error)) {
        // Search and recommendations come back empty; every other tool still works.
        Log("tool catalog unavailable " + catalog_error);
        catalog.clear();
    }
    {
        std::ostringstream oss;
        oss << "tool catalog loaded entries=" << catalog.size();
        Log(oss.str());
    }

    backend_ = std::make_unique<LocalStudioBackend>(std::move(catalog), config_.project_state_path);
    backend_->SetLogger(WithPrefix(logger_, "studio"));
    registry_ = BuildStudioToolRegistry(*backend_);
    dispatcher_ = std::make_unique<FunctionDispatcher>(registry_);
    dispatcher_->SetLogger(WithPrefix(logger_, "tools"));

    LocalStudioBackend* backend = backend_.get();
    server_ = std::make_unique<RelayServer>(
        config_,
        *dispatcher_,
        []() -> std::unique_ptr<UpstreamConnection> { return std::make_unique<GeminiLiveConnection>(); },
        [backend](const std::string& theme) { return BuildSystemInstruction(theme, backend->GetProjectStatus()); });
    server_->SetLogger(logger_);

    if (!server_->Listen(error)) {
        server_.reset();
        dispatcher_.reset();
        registry_ = ToolRegistry();
        backend_.reset();
        return false;
    }
    if (config_.api_key.empty()) {
        Log("GEMINI_API_KEY not set; sessions will be rejected with a configuration error");
    }
    return true;
}

void RelayRuntime::Stop() {
    if (!server_) {
        return;
    }
    server_->Close();
    server_.reset();
    dispatcher_.reset();
    registry_ = ToolRegistry();
    backend_.reset();
    Log("stopped");
}

bool RelayRuntime::IsRunning() const {
    return server_ != nullptr;
}

void RelayRuntime::SetLogger(LogFn logger) {
    logger_ = std::move(logger);
}

quint16 RelayRuntime::port() const {
    return server_ ? server_->port() : 0;
}

void RelayRuntime::Log(const std::string& msg) const {
    if (logger_) {
        logger_(msg);
    }
}

} // namespace voxrelay

#pragma once

#include "function_dispatcher.h"
#include "local_studio_backend.h"
#include "relay_config.h"
#include "relay_server.h"
#include "tool_registry.h"

#include <QtGlobal>

#include <memory>
#include <string>

namespace voxrelay {

// Wires the studio backend, tool registry, dispatcher and listener together for
// the server process. Start/Stop run on the Qt main thread.
class RelayRuntime {
public:
    using LogFn = RelayServer::LogFn;

    explicit RelayRuntime(RelayConfig config);
    ~RelayRuntime();

    RelayRuntime(const RelayRuntime&) = delete;
    RelayRuntime& operator=(const RelayRuntime&) = delete;

    bool Start(std::string* error);
    void Stop();
    bool IsRunning() const;
    void SetLogger(LogFn logger);
    quint16 port() const;

private:
    void Log(const std::string& msg) const;

    RelayConfig config_;
    LogFn logger_;
    std::unique_ptr<LocalStudioBackend> backend_;
    ToolRegistry registry_;
    std::unique_ptr<FunctionDispatcher> dispatcher_;
    std::unique_ptr<RelayServer> server_;
};

} // namespace voxrelay

#pragma once

#include "tool_registry.h"

#include <functional>
#include <string>

namespace voxrelay {

// Routes a ToolCall to its registered handler. Never throws: unknown names and
// failing handlers both come back as error results so upstream always gets an answer.
class FunctionDispatcher {
public:
    using LogFn = std::function<void(const std::string&)>;

    explicit FunctionDispatcher(const ToolRegistry& registry);

    FunctionDispatcher(const FunctionDispatcher&) = delete;
    FunctionDispatcher& operator=(const FunctionDispatcher&) = delete;

    void SetLogger(LogFn logger);

    ToolResult Dispatch(const ToolCall& call, const ToolContext& ctx) const;

    const ToolRegistry& registry() const { return registry_; }

private:
    void Log(const std::string& msg) const;

    const ToolRegistry& registry_;
    LogFn logger_;
};

} // namespace voxrelay

#pragma once

#include <QJsonObject>

#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace voxrelay {

// How the upstream model should surface a tool's effect in the ongoing turn.
enum class SchedulingPolicy {
    Silent,
    WhenIdle,
    NonBlocking,
};

// Upstream spelling: SILENT, WHEN_IDLE, NON_BLOCKING.
const char* SchedulingPolicyName(SchedulingPolicy policy);
bool TryParseSchedulingPolicy(const std::string& name, SchedulingPolicy* out);

struct ToolCall {
    std::string id;
    std::string name;
    QJsonObject args;
};

struct ToolResult {
    std::string id;
    std::string name;
    QJsonObject response;
    SchedulingPolicy scheduling = SchedulingPolicy::WhenIdle;
    bool ok = true;
};

// Thrown by handlers for expected failures; any std::exception is treated the same way.
class ToolExecutionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

using UiActionFn = std::function<void(const QJsonObject& action)>;

// Per-call view of the session a handler runs for.
struct ToolContext {
    std::string session_id;
    UiActionFn emit_ui_action;

    void EmitUiAction(const QJsonObject& action) const;
};

using ToolHandlerFn = std::function<QJsonObject(const QJsonObject& args, const ToolContext& ctx)>;

struct RegisteredTool {
    std::string name;
    std::string description;
    QJsonObject parameters; // JSON schema object
    SchedulingPolicy scheduling = SchedulingPolicy::WhenIdle;
    ToolHandlerFn handler;
};

// Immutable once built; shared by reference across sessions.
class ToolRegistry {
public:
    class Builder {
    public:
        // Rejects empty names, missing handlers and duplicates.
        bool Add(RegisteredTool tool, std::string* error = nullptr);
        ToolRegistry Build();

    private:
        std::vector<RegisteredTool> tools_;
    };

    ToolRegistry() = default;

    const RegisteredTool* Find(const std::string& name) const;
    const std::vector<RegisteredTool>& tools() const { return tools_; }
    std::size_t size() const { return tools_.size(); }
    bool empty() const { return tools_.empty(); }

private:
    explicit ToolRegistry(std::vector<RegisteredTool> tools);

    std::vector<RegisteredTool> tools_;
    std::unordered_map<std::string, std::size_t> index_;
};

} // namespace voxrelay

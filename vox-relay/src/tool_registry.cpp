#include "tool_registry.h"

#include <utility>

namespace voxrelay {

const char* SchedulingPolicyName(SchedulingPolicy policy) {
    switch (policy) {
    case SchedulingPolicy::Silent:
        return "SILENT";
    case SchedulingPolicy::WhenIdle:
        return "WHEN_IDLE";
    case SchedulingPolicy::NonBlocking:
        return "NON_BLOCKING";
    }
    return "WHEN_IDLE";
}

bool TryParseSchedulingPolicy(const std::string& name, SchedulingPolicy* out) {
    if (!out) {
        return false;
    }
    if (name == "SILENT" || name == "silent") {
        *out = SchedulingPolicy::Silent;
        return true;
    }
    if (name == "WHEN_IDLE" || name == "when_idle") {
        *out = SchedulingPolicy::WhenIdle;
        return true;
    }
    if (name == "NON_BLOCKING" || name == "non_blocking") {
        *out = SchedulingPolicy::NonBlocking;
        return true;
    }
    return false;
}

void ToolContext::EmitUiAction(const QJsonObject& action) const {
    if (emit_ui_action) {
        emit_ui_action(action);
    }
}

bool ToolRegistry::Builder::Add(RegisteredTool tool, std::string* error) {
    if (tool.name.empty()) {
        if (error) *error = "empty_tool_name";
        return false;
    }
    if (!tool.handler) {
        if (error) *error = "missing_handler name=" + tool.name;
        return false;
    }
    for (const auto& existing : tools_) {
        if (existing.name == tool.name) {
            if (error) *error = "duplicate_tool name=" + tool.name;
            return false;
        }
    }
    tools_.push_back(std::move(tool));
    return true;
}

ToolRegistry ToolRegistry::Builder::Build() {
    return ToolRegistry(std::move(tools_));
}

ToolRegistry::ToolRegistry(std::vector<RegisteredTool> tools)
    : tools_(std::move(tools)) {
    for (std::size_t i = 0; i < tools_.size(); ++i) {
        index_.emplace(tools_[i].name, i);
    }
}

const RegisteredTool* ToolRegistry::Find(const std::string& name) const {
    const auto it = index_.find(name);
    if (it == index_.end()) {
        return nullptr;
    }
    return &tools_[it->second];
}

} // namespace voxrelay

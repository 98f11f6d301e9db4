#include "function_dispatcher.h"

#include <exception>
#include <sstream>
#include <utility>

namespace voxrelay {

namespace {

QJsonObject ErrorResponse(const std::string& message) {
    QJsonObject obj;
    obj.insert(QStringLiteral("error"), QString::fromStdString(message));
    return obj;
}

} // namespace

FunctionDispatcher::FunctionDispatcher(const ToolRegistry& registry)
    : registry_(registry) {}

void FunctionDispatcher::SetLogger(LogFn logger) {
    logger_ = std::move(logger);
}

ToolResult FunctionDispatcher::Dispatch(const ToolCall& call, const ToolContext& ctx) const {
    ToolResult result;
    result.id = call.id;
    result.name = call.name;

    const RegisteredTool* tool = registry_.Find(call.name);
    if (!tool) {
        std::ostringstream oss;
        oss << "dispatch unknown tool name=" << call.name << " id=" << call.id
            << " session=" << ctx.session_id;
        Log(oss.str());
        result.ok = false;
        result.response = ErrorResponse("unknown tool");
        result.response.insert(
            QStringLiteral("scheduling"), QString::fromUtf8(SchedulingPolicyName(result.scheduling)));
        return result;
    }

    result.scheduling = tool->scheduling;
    try {
        result.response = tool->handler(call.args, ctx);
        result.ok = !result.response.contains(QStringLiteral("error"));
    } catch (const std::exception& e) {
        std::ostringstream oss;
        oss << "tool " << call.name << " failed: " << e.what();
        {
            std::ostringstream log;
            log << "dispatch handler threw name=" << call.name << " id=" << call.id
                << " session=" << ctx.session_id << " error=" << e.what();
            Log(log.str());
        }
        result.ok = false;
        result.response = ErrorResponse(oss.str());
        result.response.insert(QStringLiteral("tool"), QString::fromStdString(call.name));
    } catch (...) {
        std::ostringstream log;
        log << "dispatch handler threw non-standard exception name=" << call.name << " id=" << call.id
            << " session=" << ctx.session_id;
        Log(log.str());
        result.ok = false;
        result.response = ErrorResponse("tool " + call.name + " failed");
        result.response.insert(QStringLiteral("tool"), QString::fromStdString(call.name));
    }

    result.response.insert(
        QStringLiteral("scheduling"), QString::fromUtf8(SchedulingPolicyName(result.scheduling)));

    std::ostringstream oss;
    oss << "dispatch name=" << call.name << " id=" << call.id << " ok=" << (result.ok ? "true" : "false")
        << " scheduling=" << SchedulingPolicyName(result.scheduling);
    Log(oss.str());
    return result;
}

void FunctionDispatcher::Log(const std::string& msg) const {
    if (logger_) {
        logger_(msg);
    }
}

} // namespace voxrelay

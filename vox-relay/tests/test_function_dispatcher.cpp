#include "function_dispatcher.h"

#include <gtest/gtest.h>

#include <QJsonObject>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace voxrelay {
namespace {

RegisteredTool MakeTool(std::string name, SchedulingPolicy scheduling, ToolHandlerFn handler) {
    RegisteredTool tool;
    tool.name = std::move(name);
    tool.description = "test tool";
    tool.scheduling = scheduling;
    tool.handler = std::move(handler);
    return tool;
}

ToolCall MakeCall(std::string id, std::string name) {
    ToolCall call;
    call.id = std::move(id);
    call.name = std::move(name);
    return call;
}

class FunctionDispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        ToolRegistry::Builder builder;
        ASSERT_TRUE(builder.Add(MakeTool("echo", SchedulingPolicy::Silent, [](const QJsonObject& args, const ToolContext&) {
            QJsonObject out;
            out.insert("echo", args.value("value"));
            return out;
        })));
        ASSERT_TRUE(builder.Add(MakeTool("explode", SchedulingPolicy::NonBlocking, [](const QJsonObject&, const ToolContext&) -> QJsonObject {
            throw ToolExecutionError("backend offline");
        })));
        ASSERT_TRUE(builder.Add(MakeTool("crash", SchedulingPolicy::WhenIdle, [](const QJsonObject&, const ToolContext&) -> QJsonObject {
            throw std::out_of_range("index 9");
        })));
        ASSERT_TRUE(builder.Add(MakeTool("odd", SchedulingPolicy::WhenIdle, [](const QJsonObject&, const ToolContext&) -> QJsonObject {
            throw 42;
        })));
        ASSERT_TRUE(builder.Add(MakeTool("soft_fail", SchedulingPolicy::WhenIdle, [](const QJsonObject&, const ToolContext&) {
            QJsonObject out;
            out.insert("error", "No prompt provided");
            return out;
        })));
        ASSERT_TRUE(builder.Add(MakeTool("ui", SchedulingPolicy::Silent, [](const QJsonObject&, const ToolContext& ctx) {
            QJsonObject action;
            action.insert("action", "navigate");
            ctx.EmitUiAction(action);
            return QJsonObject();
        })));
        registry_ = builder.Build();
        dispatcher_ = std::make_unique<FunctionDispatcher>(registry_);
        dispatcher_->SetLogger([this](const std::string& msg) { logs_.push_back(msg); });
        ctx_.session_id = "vox-test";
    }

    ToolRegistry registry_;
    std::unique_ptr<FunctionDispatcher> dispatcher_;
    ToolContext ctx_;
    std::vector<std::string> logs_;
};

TEST_F(FunctionDispatcherTest, RoutesToHandlerAndTagsScheduling) {
    ToolCall call = MakeCall("1", "echo");
    call.args.insert("value", 42);
    const ToolResult result = dispatcher_->Dispatch(call, ctx_);
    EXPECT_TRUE(result.ok);
    EXPECT_EQ(result.id, "1");
    EXPECT_EQ(result.name, "echo");
    EXPECT_EQ(result.scheduling, SchedulingPolicy::Silent);
    EXPECT_EQ(result.response.value("echo").toInt(), 42);
    EXPECT_EQ(result.response.value("scheduling").toString(), "SILENT");
}

TEST_F(FunctionDispatcherTest, UnknownToolYieldsErrorResult) {
    ToolResult result;
    EXPECT_NO_THROW(result = dispatcher_->Dispatch(MakeCall("b", "does_not_exist"), ctx_));
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.id, "b");
    EXPECT_EQ(result.response.value("error").toString(), "unknown tool");
    EXPECT_EQ(result.response.value("scheduling").toString(), "WHEN_IDLE");
    ASSERT_FALSE(logs_.empty());
    EXPECT_NE(logs_.back().find("unknown tool name=does_not_exist"), std::string::npos);
}

TEST_F(FunctionDispatcherTest, ThrowingHandlerIsTaggedWithToolName) {
    const ToolResult result = dispatcher_->Dispatch(MakeCall("2", "explode"), ctx_);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.response.value("error").toString(), "tool explode failed: backend offline");
    EXPECT_EQ(result.response.value("tool").toString(), "explode");
    EXPECT_EQ(result.response.value("scheduling").toString(), "NON_BLOCKING");
}

TEST_F(FunctionDispatcherTest, AnyStdExceptionIsContained) {
    ToolResult result;
    EXPECT_NO_THROW(result = dispatcher_->Dispatch(MakeCall("3", "crash"), ctx_));
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.response.value("error").toString(), "tool crash failed: index 9");
}

TEST_F(FunctionDispatcherTest, NonStandardThrowIsContained) {
    ToolResult result;
    EXPECT_NO_THROW(result = dispatcher_->Dispatch(MakeCall("3b", "odd"), ctx_));
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.response.value("error").toString(), "tool odd failed");
    EXPECT_EQ(result.response.value("tool").toString(), "odd");
    EXPECT_EQ(result.response.value("scheduling").toString(), "WHEN_IDLE");
}

TEST_F(FunctionDispatcherTest, ErrorFieldMarksResultFailed) {
    const ToolResult result = dispatcher_->Dispatch(MakeCall("4", "soft_fail"), ctx_);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.response.value("error").toString(), "No prompt provided");
}

TEST_F(FunctionDispatcherTest, HandlersReachTheSessionThroughContext) {
    std::vector<QJsonObject> actions;
    ctx_.emit_ui_action = [&actions](const QJsonObject& action) { actions.push_back(action); };
    const ToolResult result = dispatcher_->Dispatch(MakeCall("5", "ui"), ctx_);
    EXPECT_TRUE(result.ok);
    ASSERT_EQ(actions.size(), 1u);
    EXPECT_EQ(actions[0].value("action").toString(), "navigate");
}

TEST_F(FunctionDispatcherTest, UiActionWithoutSinkIsHarmless) {
    EXPECT_TRUE(dispatcher_->Dispatch(MakeCall("6", "ui"), ctx_).ok);
}

TEST(ToolRegistryTest, BuilderRejectsInvalidTools) {
    ToolRegistry::Builder builder;
    std::string error;
    const auto ok = [](const QJsonObject&, const ToolContext&) { return QJsonObject(); };

    EXPECT_FALSE(builder.Add(MakeTool("", SchedulingPolicy::WhenIdle, ok), &error));
    EXPECT_FALSE(error.empty());
    EXPECT_FALSE(builder.Add(MakeTool("no_handler", SchedulingPolicy::WhenIdle, nullptr), &error));
    EXPECT_TRUE(builder.Add(MakeTool("once", SchedulingPolicy::WhenIdle, ok), &error));
    EXPECT_FALSE(builder.Add(MakeTool("once", SchedulingPolicy::Silent, ok), &error));

    const ToolRegistry registry = builder.Build();
    EXPECT_EQ(registry.size(), 1u);
    ASSERT_NE(registry.Find("once"), nullptr);
    EXPECT_EQ(registry.Find("once")->scheduling, SchedulingPolicy::WhenIdle);
    EXPECT_EQ(registry.Find("twice"), nullptr);
}

TEST(ToolRegistryTest, SchedulingPolicyNames) {
    EXPECT_STREQ(SchedulingPolicyName(SchedulingPolicy::Silent), "SILENT");
    EXPECT_STREQ(SchedulingPolicyName(SchedulingPolicy::WhenIdle), "WHEN_IDLE");
    EXPECT_STREQ(SchedulingPolicyName(SchedulingPolicy::NonBlocking), "NON_BLOCKING");

    SchedulingPolicy policy = SchedulingPolicy::Silent;
    EXPECT_TRUE(TryParseSchedulingPolicy("non_blocking", &policy));
    EXPECT_EQ(policy, SchedulingPolicy::NonBlocking);
    EXPECT_TRUE(TryParseSchedulingPolicy("WHEN_IDLE", &policy));
    EXPECT_EQ(policy, SchedulingPolicy::WhenIdle);
    EXPECT_FALSE(TryParseSchedulingPolicy("later", &policy));
}

} // namespace
} // namespace voxrelay

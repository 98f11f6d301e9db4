#include "control_protocol.h"

#include <gtest/gtest.h>

#include <QJsonObject>

#include <string>

namespace voxrelay {
namespace {

ServerMessage ParseServer(const std::string& json) {
    ServerMessage msg;
    EXPECT_TRUE(TryParseServerMessage(json, &msg)) << json;
    return msg;
}

TEST(ControlProtocolTest, StartDefaultsToExpertTheme) {
    ClientMessage msg;
    ASSERT_TRUE(TryParseClientMessage(R"({"type":"start"})", &msg));
    EXPECT_EQ(msg.type, ClientMessageType::Start);
    EXPECT_EQ(msg.theme, "expert");
    EXPECT_TRUE(msg.voice.empty());
    EXPECT_TRUE(msg.resume_handle.empty());
}

TEST(ControlProtocolTest, StartCarriesThemeVoiceAndResumeHandle) {
    ClientMessage msg;
    ASSERT_TRUE(TryParseClientMessage(
        R"({"type":"start","theme":"retro","voice":"Puck","resume_handle":"h-9"})", &msg));
    EXPECT_EQ(msg.theme, "retro");
    EXPECT_EQ(msg.voice, "Puck");
    EXPECT_EQ(msg.resume_handle, "h-9");
}

TEST(ControlProtocolTest, MuteWithAndWithoutExplicitValue) {
    ClientMessage msg;
    ASSERT_TRUE(TryParseClientMessage(R"({"type":"mute","muted":true})", &msg));
    EXPECT_EQ(msg.type, ClientMessageType::Mute);
    EXPECT_TRUE(msg.has_muted);
    EXPECT_TRUE(msg.muted);

    ASSERT_TRUE(TryParseClientMessage(R"({"type":"mute"})", &msg));
    EXPECT_FALSE(msg.has_muted);
}

TEST(ControlProtocolTest, TextRequiresContent) {
    ClientMessage msg;
    std::string error;
    EXPECT_FALSE(TryParseClientMessage(R"({"type":"text"})", &msg, &error));
    EXPECT_EQ(error, "missing_content");
    EXPECT_FALSE(TryParseClientMessage(R"({"type":"text","content":""})", &msg, &error));
    EXPECT_EQ(error, "missing_content");

    ASSERT_TRUE(TryParseClientMessage(R"({"type":"text","content":"add charts"})", &msg, &error));
    EXPECT_EQ(msg.type, ClientMessageType::Text);
    EXPECT_EQ(msg.content, "add charts");
}

TEST(ControlProtocolTest, RejectsMalformedFrames) {
    ClientMessage msg;
    std::string error;
    EXPECT_FALSE(TryParseClientMessage("not json", &msg, &error));
    EXPECT_EQ(error, "bad_json");
    EXPECT_FALSE(TryParseClientMessage("[1,2]", &msg, &error));
    EXPECT_EQ(error, "bad_json");
    EXPECT_FALSE(TryParseClientMessage(R"({"content":"x"})", &msg, &error));
    EXPECT_EQ(error, "missing_type");
    EXPECT_FALSE(TryParseClientMessage(R"({"type":7})", &msg, &error));
    EXPECT_EQ(error, "missing_type");
    EXPECT_FALSE(TryParseClientMessage(R"({"type":"dance"})", &msg, &error));
    EXPECT_EQ(error, "unknown_type");
}

TEST(ControlProtocolTest, ClientBuildersParseBack) {
    ClientMessage msg;
    ASSERT_TRUE(TryParseClientMessage(BuildStartMessage("", "", "tok"), &msg));
    EXPECT_EQ(msg.theme, "expert");
    EXPECT_EQ(msg.resume_handle, "tok");
    ASSERT_TRUE(TryParseClientMessage(BuildMuteMessage(false), &msg));
    EXPECT_TRUE(msg.has_muted);
    EXPECT_FALSE(msg.muted);
    ASSERT_TRUE(TryParseClientMessage(BuildMuteToggleMessage(), &msg));
    EXPECT_FALSE(msg.has_muted);
    ASSERT_TRUE(TryParseClientMessage(BuildEndMessage(), &msg));
    EXPECT_EQ(msg.type, ClientMessageType::End);
}

TEST(ControlProtocolTest, ReadyMessage) {
    const ServerMessage msg = ParseServer(BuildReadyMessage("vox-1", "Orus"));
    EXPECT_EQ(msg.type, "ready");
    EXPECT_EQ(msg.body.value("sessionId").toString(), "vox-1");
    EXPECT_EQ(msg.body.value("voice").toString(), "Orus");
}

TEST(ControlProtocolTest, TranscriptMessage) {
    TranscriptEntry entry;
    entry.role = TranscriptRole::Assistant;
    entry.text = "Adding D3 now.";
    entry.timestamp_ms = 1700000000123;
    const ServerMessage msg = ParseServer(BuildTranscriptMessage(entry));
    EXPECT_EQ(msg.type, "transcript");
    EXPECT_EQ(msg.body.value("role").toString(), "assistant");
    EXPECT_EQ(msg.body.value("text").toString(), "Adding D3 now.");
    EXPECT_EQ(msg.body.value("timestamp_ms").toVariant().toLongLong(), 1700000000123LL);
}

TEST(ControlProtocolTest, ToolMessagesKeepIds) {
    ToolCall call;
    call.id = "c1";
    call.name = "add_tool";
    call.args.insert("tool_id", "d3-js");
    ServerMessage msg = ParseServer(BuildToolCallMessage(call));
    EXPECT_EQ(msg.type, "tool_call");
    EXPECT_EQ(msg.body.value("id").toString(), "c1");
    EXPECT_EQ(msg.body.value("args").toObject().value("tool_id").toString(), "d3-js");

    ToolResult result;
    result.id = "c1";
    result.name = "add_tool";
    result.response.insert("status", "tool_added");
    msg = ParseServer(BuildToolResultMessage(result));
    EXPECT_EQ(msg.type, "tool_result");
    EXPECT_EQ(msg.body.value("id").toString(), "c1");
    EXPECT_EQ(msg.body.value("data").toObject().value("status").toString(), "tool_added");
}

TEST(ControlProtocolTest, UiActionIsFlattened) {
    QJsonObject action;
    action.insert("action", "navigate");
    action.insert("target", "settings");
    const ServerMessage msg = ParseServer(BuildUiActionMessage(action));
    EXPECT_EQ(msg.type, "ui_action");
    EXPECT_EQ(msg.body.value("action").toString(), "navigate");
    EXPECT_EQ(msg.body.value("target").toString(), "settings");
}

TEST(ControlProtocolTest, ErrorAndSessionEnd) {
    ServerMessage msg = ParseServer(BuildErrorMessage(SessionErrorKind::UpstreamLost, "Session lost: reset"));
    EXPECT_EQ(msg.type, "error");
    EXPECT_EQ(msg.body.value("code").toString(), "upstream_lost");
    EXPECT_EQ(msg.body.value("message").toString(), "Session lost: reset");

    msg = ParseServer(BuildSessionEndMessage(CloseReason::Timeout));
    EXPECT_EQ(msg.type, "session_end");
    EXPECT_EQ(msg.body.value("reason").toString(), "timeout");
    EXPECT_FALSE(msg.body.contains("resume_handle"));

    msg = ParseServer(BuildSessionEndMessage(CloseReason::UpstreamClosed, "h-2"));
    EXPECT_EQ(msg.body.value("reason").toString(), "upstream_closed");
    EXPECT_EQ(msg.body.value("resume_handle").toString(), "h-2");
}

TEST(ControlProtocolTest, GoAwayCarriesMilliseconds) {
    const ServerMessage msg = ParseServer(BuildGoAwayMessage(9500));
    EXPECT_EQ(msg.type, "go_away");
    EXPECT_EQ(msg.body.value("time_left_ms").toInt(), 9500);
}

TEST(ControlProtocolTest, ServerParseRejectsUntyped) {
    ServerMessage msg;
    EXPECT_FALSE(TryParseServerMessage(R"({"reason":"user"})", &msg));
    EXPECT_FALSE(TryParseServerMessage("garbage", &msg));
}

} // namespace
} // namespace voxrelay

#pragma once

#include "session_types.h"
#include "tool_registry.h"

#include <QJsonObject>

#include <cstdint>
#include <string>

namespace voxrelay {

constexpr const char* kDefaultTheme = "expert";

enum class ClientMessageType {
    Start,
    Mute,
    Text,
    End,
};

struct ClientMessage {
    ClientMessageType type = ClientMessageType::End;

    // start
    std::string theme = kDefaultTheme;
    std::string voice;
    std::string resume_handle;

    // mute; absent `muted` toggles
    bool has_muted = false;
    bool muted = false;

    // text
    std::string content;
};

// Text-frame parsing for client -> server messages. On failure `error` names the
// violation (bad_json, missing_type, unknown_type, missing_content).
bool TryParseClientMessage(const std::string& json, ClientMessage* out, std::string* error = nullptr);

// Server -> client.
std::string BuildReadyMessage(const std::string& session_id, const std::string& voice);
std::string BuildTranscriptMessage(const TranscriptEntry& entry);
std::string BuildToolCallMessage(const ToolCall& call);
std::string BuildToolResultMessage(const ToolResult& result);
std::string BuildUiActionMessage(const QJsonObject& action);
std::string BuildGoAwayMessage(std::int64_t time_left_ms);
std::string BuildTurnCompleteMessage();
std::string BuildInterruptedMessage();
std::string BuildErrorMessage(SessionErrorKind kind, const std::string& message);
std::string BuildSessionEndMessage(CloseReason reason, const std::string& resume_handle = std::string());

// Client -> server, used by the desktop client.
std::string BuildStartMessage(
    const std::string& theme,
    const std::string& voice = std::string(),
    const std::string& resume_handle = std::string());
std::string BuildMuteMessage(bool muted);
std::string BuildMuteToggleMessage();
std::string BuildTextMessage(const std::string& content);
std::string BuildEndMessage();

struct ServerMessage {
    std::string type;
    QJsonObject body;
};

bool TryParseServerMessage(const std::string& json, ServerMessage* out);

} // namespace voxrelay

#pragma once

#include "audio_codec.h"
#include "tool_registry.h"
#include "upstream_connection.h"

#include <QByteArray>
#include <QJsonArray>

#include <cstdint>
#include <string>
#include <vector>

namespace voxrelay {

constexpr const char* kDefaultLiveModel = "gemini-2.5-flash-native-audio-preview-12-2025";
constexpr const char* kDefaultUpstreamUrl =
    "wss://generativelanguage.googleapis.com/ws/"
    "google.ai.generativelanguage.v1beta.GenerativeService.BidiGenerateContent";
constexpr const char* kInboundAudioMimeType = "audio/pcm;rate=16000";

// Every tool is declared NON_BLOCKING so the model keeps talking while it runs.
QJsonArray BuildFunctionDeclarations(const ToolRegistry& registry);

std::string BuildSetupMessage(const UpstreamSetup& setup);
std::string BuildRealtimeAudioMessage(const AudioFrame& frame);
std::string BuildClientTextMessage(const std::string& text);
std::string BuildToolResponseMessage(const std::vector<ToolResult>& results);

struct DecodedServerMessage {
    bool setup_complete = false;
    std::vector<UpstreamEvent> events; // in the order they appear in the message
};

// Decodes one upstream server message. Unknown fields are ignored; returns false
// only when the payload is not a JSON object.
bool DecodeServerMessage(const QByteArray& json, DecodedServerMessage* out, std::string* error = nullptr);

// Protobuf duration strings such as "9.5s" or "30s".
bool ParseDurationMs(const std::string& text, std::int64_t* out_ms);

} // namespace voxrelay

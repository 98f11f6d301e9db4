#pragma once

#include "audio_codec.h"
#include "session_types.h"
#include "tool_registry.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace voxrelay {

// Outbound model speech, 24 kHz mono.
struct AudioChunk {
    std::vector<std::int16_t> samples;
};

struct ToolCallBatch {
    std::vector<ToolCall> calls;
};

struct TranscriptFragment {
    TranscriptRole role = TranscriptRole::Assistant;
    std::string text;
};

struct TurnComplete {};

struct Interrupted {};

struct ResumptionUpdate {
    std::string new_handle;
    bool resumable = false;
};

struct GoAway {
    std::int64_t time_left_ms = 0;
};

struct ToolCallCancellation {
    std::vector<std::string> ids;
};

struct UpstreamError {
    std::string message;
};

using UpstreamEvent = std::variant<
    AudioChunk,
    ToolCallBatch,
    TranscriptFragment,
    TurnComplete,
    Interrupted,
    ResumptionUpdate,
    GoAway,
    ToolCallCancellation,
    UpstreamError>;

// Everything the upstream handshake needs.
struct UpstreamSetup {
    std::string url;
    std::string api_key;
    std::string model;
    std::string voice;
    std::string system_instruction;
    std::string resume_handle;
    const ToolRegistry* tools = nullptr;
};

// One bidirectional upstream session. Owned by a single SessionManager and used
// only from its worker thread, so implementations need no locking.
class UpstreamConnection {
public:
    using LogFn = std::function<void(const std::string&)>;
    // Polled while Open() waits; returning false abandons the handshake.
    using ContinueFn = std::function<bool()>;

    enum class ReadResult {
        Timeout,
        Event,
        Disconnected,
    };

    virtual ~UpstreamConnection() = default;

    virtual void SetLogger(LogFn logger) = 0;

    // Connects and completes the setup handshake. Fails with "canceled" as soon
    // as `should_continue` returns false.
    virtual bool Open(const UpstreamSetup& setup, const ContinueFn& should_continue, std::string* error) = 0;

    // A transport failure surfaces as an UpstreamError event followed by
    // Disconnected; a clean remote close yields Disconnected alone.
    virtual ReadResult TryReadEvent(UpstreamEvent* out, int timeout_ms) = 0;

    virtual bool SendAudio(const AudioFrame& frame) = 0;
    virtual bool SendText(const std::string& text) = 0;
    virtual bool SendToolResponses(const std::vector<ToolResult>& results) = 0;

    virtual void Close() = 0;
};

using UpstreamFactory = std::function<std::unique_ptr<UpstreamConnection>()>;

} // namespace voxrelay

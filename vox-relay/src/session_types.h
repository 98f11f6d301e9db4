#pragma once

#include <cstdint>
#include <string>

namespace voxrelay {

enum class SessionState {
    Idle,
    Connecting,
    Active,
    Degraded,
    Closed,
};

enum class TranscriptRole {
    User,
    Assistant,
};

struct TranscriptEntry {
    TranscriptRole role = TranscriptRole::User;
    std::string text;
    std::int64_t timestamp_ms = 0;
};

enum class SessionErrorKind {
    Configuration,
    UpstreamUnavailable,
    UpstreamLost,
};

enum class CloseReason {
    User,
    Timeout,
    Error,
    UpstreamClosed,
};

const char* SessionStateName(SessionState state);
const char* TranscriptRoleName(TranscriptRole role);
const char* SessionErrorCode(SessionErrorKind kind);
const char* CloseReasonName(CloseReason reason);

std::int64_t NowUnixMs();

// Process-unique, e.g. "vox-1760700000000-3".
std::string NewSessionId();

} // namespace voxrelay

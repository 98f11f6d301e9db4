#include "session_types.h"

#include <atomic>
#include <chrono>
#include <sstream>

namespace voxrelay {

const char* SessionStateName(SessionState state) {
    switch (state) {
    case SessionState::Idle:
        return "idle";
    case SessionState::Connecting:
        return "connecting";
    case SessionState::Active:
        return "active";
    case SessionState::Degraded:
        return "degraded";
    case SessionState::Closed:
        return "closed";
    }
    return "unknown";
}

const char* TranscriptRoleName(TranscriptRole role) {
    return role == TranscriptRole::Assistant ? "assistant" : "user";
}

const char* SessionErrorCode(SessionErrorKind kind) {
    switch (kind) {
    case SessionErrorKind::Configuration:
        return "configuration";
    case SessionErrorKind::UpstreamUnavailable:
        return "upstream_unavailable";
    case SessionErrorKind::UpstreamLost:
        return "upstream_lost";
    }
    return "upstream_lost";
}

const char* CloseReasonName(CloseReason reason) {
    switch (reason) {
    case CloseReason::User:
        return "user";
    case CloseReason::Timeout:
        return "timeout";
    case CloseReason::Error:
        return "error";
    case CloseReason::UpstreamClosed:
        return "upstream_closed";
    }
    return "error";
}

std::int64_t NowUnixMs() {
    using namespace std::chrono;
    return static_cast<std::int64_t>(
        duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

std::string NewSessionId() {
    static std::atomic<std::uint64_t> seq{1};
    std::ostringstream oss;
    oss << "vox-" << NowUnixMs() << "-" << seq.fetch_add(1);
    return oss.str();
}

} // namespace voxrelay

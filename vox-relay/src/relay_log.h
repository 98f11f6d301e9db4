#pragma once

#include <functional>
#include <string>

namespace voxrelay {

using LogFn = std::function<void(const std::string&)>;

// Thread-safe stdout sink: "[tag] message". Per-frame audio chatter is
// suppressed unless verbose.
LogFn MakeConsoleLogger(const std::string& tag, bool verbose);

// Shared prefix for sub-components that log through a parent's sink.
LogFn WithPrefix(LogFn sink, const std::string& prefix);

bool IsNoisyLogMessage(const std::string& msg);

} // namespace voxrelay

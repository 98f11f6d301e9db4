#include "relay_log.h"

#include <iostream>
#include <memory>
#include <mutex>
#include <utility>

namespace voxrelay {

namespace {
const char* const kNoisyPrefixes[] = {
    "audio ",
    "text dropped ",
};
} // namespace

bool IsNoisyLogMessage(const std::string& msg) {
    for (const char* prefix : kNoisyPrefixes) {
        if (msg.rfind(prefix, 0) == 0) {
            return true;
        }
    }
    return false;
}

LogFn MakeConsoleLogger(const std::string& tag, bool verbose) {
    auto mu = std::make_shared<std::mutex>();
    return [mu, tag, verbose](const std::string& msg) {
        if (!verbose && IsNoisyLogMessage(msg)) {
            return;
        }
        std::lock_guard<std::mutex> lock(*mu);
        std::cout << "[" << tag << "] " << msg << std::endl;
    };
}

LogFn WithPrefix(LogFn sink, const std::string& prefix) {
    if (!sink) {
        return sink;
    }
    return [sink = std::move(sink), prefix](const std::string& msg) {
        if (IsNoisyLogMessage(msg)) {
            // Keep the filterable prefix at the front.
            sink(msg + " component=" + prefix);
            return;
        }
        sink(prefix + ": " + msg);
    };
}

} // namespace voxrelay

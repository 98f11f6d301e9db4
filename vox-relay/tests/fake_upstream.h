#pragma once

#include "upstream_connection.h"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace voxrelay {
namespace testing_support {

// Script and recording shared between a test and the FakeUpstreamConnection it
// hands to a SessionManager.
struct FakeUpstreamState {
    std::mutex mu;
    std::condition_variable cv;

    bool open_ok = true;
    std::string open_error = "connection refused";
    // Holds Open() in its handshake until cleared or canceled.
    bool block_open = false;
    bool fail_tool_responses = false;

    std::deque<UpstreamEvent> events;
    bool remote_closed = false;

    int open_calls = 0;
    UpstreamSetup setup;
    std::vector<AudioFrame> audio;
    std::vector<std::string> texts;
    std::vector<std::vector<ToolResult>> tool_responses;
    bool closed = false;

    void Push(UpstreamEvent event) {
        {
            std::lock_guard<std::mutex> lock(mu);
            events.push_back(std::move(event));
        }
        cv.notify_all();
    }

    void CloseFromRemote() {
        {
            std::lock_guard<std::mutex> lock(mu);
            remote_closed = true;
        }
        cv.notify_all();
    }

    template <typename Fn>
    auto Read(Fn fn) -> decltype(fn()) {
        std::lock_guard<std::mutex> lock(mu);
        return fn();
    }
};

class FakeUpstreamConnection : public UpstreamConnection {
public:
    explicit FakeUpstreamConnection(std::shared_ptr<FakeUpstreamState> state) : state_(std::move(state)) {}

    void SetLogger(LogFn) override {}

    bool Open(const UpstreamSetup& setup, const ContinueFn& should_continue, std::string* error) override {
        std::unique_lock<std::mutex> lock(state_->mu);
        ++state_->open_calls;
        state_->setup = setup;
        while (state_->block_open) {
            if (should_continue && !should_continue()) {
                *error = "canceled";
                return false;
            }
            state_->cv.wait_for(lock, std::chrono::milliseconds(10));
        }
        if (!state_->open_ok) {
            *error = state_->open_error;
            return false;
        }
        return true;
    }

    ReadResult TryReadEvent(UpstreamEvent* out, int timeout_ms) override {
        std::unique_lock<std::mutex> lock(state_->mu);
        state_->cv.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] {
            return !state_->events.empty() || state_->remote_closed;
        });
        if (!state_->events.empty()) {
            *out = std::move(state_->events.front());
            state_->events.pop_front();
            return ReadResult::Event;
        }
        return state_->remote_closed ? ReadResult::Disconnected : ReadResult::Timeout;
    }

    bool SendAudio(const AudioFrame& frame) override {
        std::lock_guard<std::mutex> lock(state_->mu);
        state_->audio.push_back(frame);
        return true;
    }

    bool SendText(const std::string& text) override {
        std::lock_guard<std::mutex> lock(state_->mu);
        state_->texts.push_back(text);
        return true;
    }

    bool SendToolResponses(const std::vector<ToolResult>& results) override {
        std::lock_guard<std::mutex> lock(state_->mu);
        state_->tool_responses.push_back(results);
        return !state_->fail_tool_responses;
    }

    void Close() override {
        std::lock_guard<std::mutex> lock(state_->mu);
        state_->closed = true;
    }

private:
    std::shared_ptr<FakeUpstreamState> state_;
};

inline UpstreamFactory MakeFakeUpstreamFactory(std::shared_ptr<FakeUpstreamState> state) {
    return [state]() -> std::unique_ptr<UpstreamConnection> {
        return std::make_unique<FakeUpstreamConnection>(state);
    };
}

// Polls `pred` until it holds or `timeout` passes.
inline bool WaitUntil(const std::function<bool()>& pred,
                      std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

} // namespace testing_support
} // namespace voxrelay

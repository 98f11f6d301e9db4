#include "fake_upstream.h"
#include "function_dispatcher.h"
#include "session_manager.h"

#include <gtest/gtest.h>

#include <QJsonObject>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace voxrelay {
namespace {

using testing_support::FakeUpstreamState;
using testing_support::MakeFakeUpstreamFactory;
using testing_support::WaitUntil;

class RecordingListener : public SessionListener {
public:
    void OnStateChanged(SessionState state) override {
        std::lock_guard<std::mutex> lock(mu_);
        states_.push_back(state);
    }
    void OnAudio(const AudioFrame&) override {
        std::lock_guard<std::mutex> lock(mu_);
        ++audio_frames_;
    }
    void OnTranscript(const TranscriptEntry& entry) override {
        std::lock_guard<std::mutex> lock(mu_);
        transcripts_.push_back(entry);
    }
    void OnToolCall(const ToolCall& call) override {
        std::lock_guard<std::mutex> lock(mu_);
        tool_calls_.push_back(call.id);
    }
    void OnToolResult(const ToolResult& result) override {
        std::lock_guard<std::mutex> lock(mu_);
        tool_results_.push_back(result);
    }
    void OnUiAction(const QJsonObject& action) override {
        std::lock_guard<std::mutex> lock(mu_);
        ui_actions_.push_back(action);
    }
    void OnGoAway(std::int64_t time_left_ms) override {
        std::lock_guard<std::mutex> lock(mu_);
        go_aways_.push_back(time_left_ms);
    }
    void OnTurnComplete() override {
        std::lock_guard<std::mutex> lock(mu_);
        ++turns_;
    }
    void OnInterrupted() override {
        std::lock_guard<std::mutex> lock(mu_);
        ++interruptions_;
    }
    void OnSessionError(SessionErrorKind kind, const std::string& message) override {
        std::lock_guard<std::mutex> lock(mu_);
        errors_.push_back({kind, message});
    }
    void OnSessionClosed(CloseReason reason) override {
        std::lock_guard<std::mutex> lock(mu_);
        closes_.push_back(reason);
    }

    struct Error {
        SessionErrorKind kind;
        std::string message;
    };

    std::vector<SessionState> states() const { return Locked(states_); }
    std::vector<TranscriptEntry> transcripts() const { return Locked(transcripts_); }
    std::vector<std::string> tool_calls() const { return Locked(tool_calls_); }
    std::vector<ToolResult> tool_results() const { return Locked(tool_results_); }
    std::vector<QJsonObject> ui_actions() const { return Locked(ui_actions_); }
    std::vector<std::int64_t> go_aways() const { return Locked(go_aways_); }
    std::vector<Error> errors() const { return Locked(errors_); }
    std::vector<CloseReason> closes() const { return Locked(closes_); }
    int audio_frames() const { return Locked(audio_frames_); }
    int turns() const { return Locked(turns_); }
    int interruptions() const { return Locked(interruptions_); }

private:
    template <typename T>
    T Locked(const T& value) const {
        std::lock_guard<std::mutex> lock(mu_);
        return value;
    }

    mutable std::mutex mu_;
    std::vector<SessionState> states_;
    std::vector<TranscriptEntry> transcripts_;
    std::vector<std::string> tool_calls_;
    std::vector<ToolResult> tool_results_;
    std::vector<QJsonObject> ui_actions_;
    std::vector<std::int64_t> go_aways_;
    std::vector<Error> errors_;
    std::vector<CloseReason> closes_;
    int audio_frames_ = 0;
    int turns_ = 0;
    int interruptions_ = 0;
};

ToolRegistry TestRegistry() {
    ToolRegistry::Builder builder;
    RegisteredTool status;
    status.name = "get_project_status";
    status.handler = [](const QJsonObject&, const ToolContext&) {
        QJsonObject out;
        out.insert("status", "no_project");
        return out;
    };
    EXPECT_TRUE(builder.Add(status));
    RegisteredTool navigate;
    navigate.name = "navigate_ui";
    navigate.scheduling = SchedulingPolicy::Silent;
    navigate.handler = [](const QJsonObject& args, const ToolContext& ctx) {
        QJsonObject action;
        action.insert("action", "navigate");
        action.insert("target", args.value("target"));
        ctx.EmitUiAction(action);
        QJsonObject out;
        out.insert("status", "navigated");
        return out;
    };
    EXPECT_TRUE(builder.Add(navigate));
    return builder.Build();
}

AudioFrame MicFrame(std::size_t samples = 320) {
    return AudioFrame(AudioDirection::Inbound, "mic", std::vector<std::int16_t>(samples, 100));
}

class SessionManagerTest : public ::testing::Test {
protected:
    SessionManagerTest()
        : registry_(TestRegistry()),
          dispatcher_(registry_),
          upstream_(std::make_shared<FakeUpstreamState>()),
          session_("vox-test", dispatcher_, MakeFakeUpstreamFactory(upstream_), listener_) {}

    SessionConfig Config() const {
        SessionConfig config;
        config.theme = "expert";
        config.voice = "Orus";
        config.model = "gemini-live-test";
        config.api_key = "test-key";
        config.upstream_url = "ws://127.0.0.1:1/unused";
        config.system_instruction = "Be brief.";
        return config;
    }

    void ConnectActive(SessionConfig config) {
        ASSERT_TRUE(session_.Connect(config));
        ASSERT_TRUE(WaitUntil([this] { return session_.state() == SessionState::Active; }));
    }

    std::size_t UpstreamAudio() {
        return upstream_->Read([this] { return upstream_->audio.size(); });
    }

    ToolRegistry registry_;
    FunctionDispatcher dispatcher_;
    std::shared_ptr<FakeUpstreamState> upstream_;
    RecordingListener listener_;
    SessionManager session_;
};

TEST_F(SessionManagerTest, MissingCredentialIsAConfigurationError) {
    SessionConfig config = Config();
    config.api_key.clear();
    SessionErrorKind kind = SessionErrorKind::UpstreamLost;
    std::string error;
    EXPECT_FALSE(session_.Connect(config, &kind, &error));
    EXPECT_EQ(kind, SessionErrorKind::Configuration);
    EXPECT_EQ(error, "GEMINI_API_KEY not set");
    EXPECT_EQ(session_.state(), SessionState::Closed);
    EXPECT_EQ(upstream_->Read([this] { return upstream_->open_calls; }), 0);
    EXPECT_TRUE(listener_.errors().empty());
    EXPECT_EQ(listener_.states(), std::vector<SessionState>{SessionState::Closed});
}

TEST_F(SessionManagerTest, ConnectsAndForwardsAudio) {
    SessionConfig config = Config();
    config.resume_handle = "h-0";
    ConnectActive(config);
    EXPECT_EQ(listener_.states(), (std::vector<SessionState>{SessionState::Connecting, SessionState::Active}));

    const UpstreamSetup setup = upstream_->Read([this] { return upstream_->setup; });
    EXPECT_EQ(setup.voice, "Orus");
    EXPECT_EQ(setup.resume_handle, "h-0");
    EXPECT_EQ(setup.tools, &registry_);

    session_.SendAudio(MicFrame());
    ASSERT_TRUE(WaitUntil([this] { return session_.forwarded_frames() == 1; }));
    EXPECT_EQ(UpstreamAudio(), 1u);
    EXPECT_EQ(upstream_->Read([this] { return upstream_->audio[0].samples().size(); }), 320u);
}

TEST_F(SessionManagerTest, SecondConnectIsRejected) {
    ConnectActive(Config());
    std::string error;
    EXPECT_FALSE(session_.Connect(Config(), nullptr, &error));
    EXPECT_EQ(error, "session already active");
}

TEST_F(SessionManagerTest, AudioBeforeActiveIsDropped) {
    session_.SendAudio(MicFrame());
    ConnectActive(Config());
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(UpstreamAudio(), 0u);
}

TEST_F(SessionManagerTest, MutedFramesNeverReachUpstream) {
    ConnectActive(Config());
    session_.SetMuted(true);
    for (int i = 0; i < 3; ++i) {
        session_.SendAudio(MicFrame());
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(UpstreamAudio(), 0u);
    EXPECT_EQ(session_.muted_drops(), 3u);
    EXPECT_EQ(session_.forwarded_frames(), 0u);

    session_.SetMuted(false);
    session_.SendAudio(MicFrame());
    EXPECT_TRUE(WaitUntil([this] { return UpstreamAudio() == 1; }));
}

TEST_F(SessionManagerTest, TextIsForwardedAsAUserTurn) {
    ConnectActive(Config());
    session_.SendText("add a chart");
    ASSERT_TRUE(WaitUntil([this] { return upstream_->Read([this] { return upstream_->texts.size(); }) == 1; }));
    EXPECT_EQ(upstream_->Read([this] { return upstream_->texts[0]; }), "add a chart");
}

TEST_F(SessionManagerTest, DisconnectTwiceClosesOnce) {
    ConnectActive(Config());
    session_.Disconnect();
    session_.Disconnect();
    EXPECT_EQ(session_.state(), SessionState::Closed);
    EXPECT_TRUE(upstream_->Read([this] { return upstream_->closed; }));
    EXPECT_TRUE(listener_.errors().empty());
    EXPECT_TRUE(listener_.closes().empty());

    const std::vector<SessionState> states = listener_.states();
    ASSERT_FALSE(states.empty());
    EXPECT_EQ(states.back(), SessionState::Closed);
    EXPECT_EQ(std::count(states.begin(), states.end(), SessionState::Closed), 1);

    session_.SendAudio(MicFrame());
    EXPECT_EQ(UpstreamAudio(), 0u);
}

TEST_F(SessionManagerTest, HandshakeFailureIsUpstreamUnavailable) {
    upstream_->Read([this] {
        upstream_->open_ok = false;
        upstream_->open_error = "connection refused";
        return 0;
    });
    ASSERT_TRUE(session_.Connect(Config()));
    ASSERT_TRUE(WaitUntil([this] { return !listener_.closes().empty(); }));
    const auto errors = listener_.errors();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].kind, SessionErrorKind::UpstreamUnavailable);
    EXPECT_EQ(errors[0].message, "Upstream unavailable: connection refused");
    EXPECT_EQ(listener_.closes(), std::vector<CloseReason>{CloseReason::Error});
    EXPECT_EQ(session_.state(), SessionState::Closed);
}

TEST_F(SessionManagerTest, DisconnectDuringHandshakeReturnsPromptly) {
    upstream_->Read([this] {
        upstream_->block_open = true;
        return 0;
    });
    ASSERT_TRUE(session_.Connect(Config()));
    ASSERT_TRUE(WaitUntil([this] { return upstream_->Read([this] { return upstream_->open_calls; }) == 1; }));
    EXPECT_EQ(session_.state(), SessionState::Connecting);

    const auto started = std::chrono::steady_clock::now();
    session_.Disconnect();
    const auto elapsed = std::chrono::steady_clock::now() - started;
    EXPECT_LT(elapsed, std::chrono::milliseconds(1000));

    EXPECT_EQ(session_.state(), SessionState::Closed);
    EXPECT_TRUE(listener_.errors().empty());
    EXPECT_TRUE(listener_.closes().empty());
}

TEST_F(SessionManagerTest, UpstreamErrorEndsSessionAsLost) {
    ConnectActive(Config());
    upstream_->Push(UpstreamError{"connection reset"});
    ASSERT_TRUE(WaitUntil([this] { return !listener_.closes().empty(); }));
    const auto errors = listener_.errors();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].kind, SessionErrorKind::UpstreamLost);
    EXPECT_EQ(errors[0].message, "Session lost: connection reset");
    EXPECT_EQ(listener_.closes(), std::vector<CloseReason>{CloseReason::Error});
    EXPECT_EQ(session_.state(), SessionState::Closed);
}

TEST_F(SessionManagerTest, RemoteCloseEndsSessionWithoutError) {
    ConnectActive(Config());
    upstream_->CloseFromRemote();
    ASSERT_TRUE(WaitUntil([this] { return !listener_.closes().empty(); }));
    EXPECT_EQ(listener_.closes(), std::vector<CloseReason>{CloseReason::UpstreamClosed});
    EXPECT_TRUE(listener_.errors().empty());
}

TEST_F(SessionManagerTest, GoAwayDegradesThenTimesOut) {
    ConnectActive(Config());
    upstream_->Push(GoAway{300});
    ASSERT_TRUE(WaitUntil([this] { return session_.state() == SessionState::Degraded; }));
    EXPECT_EQ(listener_.go_aways(), std::vector<std::int64_t>{300});

    session_.SendAudio(MicFrame());
    EXPECT_TRUE(WaitUntil([this] { return UpstreamAudio() == 1; }));

    ASSERT_TRUE(WaitUntil([this] { return !listener_.closes().empty(); }));
    EXPECT_EQ(listener_.closes(), std::vector<CloseReason>{CloseReason::Timeout});
    EXPECT_TRUE(listener_.errors().empty());
    EXPECT_EQ(session_.state(), SessionState::Closed);
}

TEST_F(SessionManagerTest, ToolBatchIsAnsweredInOneResponse) {
    ConnectActive(Config());
    ToolCallBatch batch;
    ToolCall a;
    a.id = "a";
    a.name = "navigate_ui";
    a.args.insert("target", "settings");
    ToolCall b;
    b.id = "b";
    b.name = "does_not_exist";
    batch.calls = {a, b};
    upstream_->Push(batch);

    ASSERT_TRUE(WaitUntil([this] { return upstream_->Read([this] { return upstream_->tool_responses.size(); }) == 1; }));
    const std::vector<ToolResult> sent = upstream_->Read([this] { return upstream_->tool_responses[0]; });
    ASSERT_EQ(sent.size(), 2u);
    EXPECT_EQ(sent[0].id, "a");
    EXPECT_TRUE(sent[0].ok);
    EXPECT_EQ(sent[1].id, "b");
    EXPECT_FALSE(sent[1].ok);

    EXPECT_EQ(listener_.tool_calls(), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(listener_.tool_results().size(), 2u);
    const auto actions = listener_.ui_actions();
    ASSERT_EQ(actions.size(), 1u);
    EXPECT_EQ(actions[0].value("target").toString(), "settings");
}

TEST_F(SessionManagerTest, FailedToolResponseEndsSession) {
    upstream_->Read([this] {
        upstream_->fail_tool_responses = true;
        return 0;
    });
    ConnectActive(Config());
    ToolCallBatch batch;
    ToolCall call;
    call.id = "s1";
    call.name = "get_project_status";
    batch.calls = {call};
    upstream_->Push(batch);

    ASSERT_TRUE(WaitUntil([this] { return !listener_.closes().empty(); }));
    EXPECT_EQ(listener_.closes(), std::vector<CloseReason>{CloseReason::Error});
    const auto errors = listener_.errors();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].kind, SessionErrorKind::UpstreamLost);
    EXPECT_EQ(errors[0].message, "Session lost: tool response send failed");
    EXPECT_EQ(session_.state(), SessionState::Closed);
}

TEST_F(SessionManagerTest, ResumptionTokenFollowsResumableUpdates) {
    SessionConfig config = Config();
    config.resume_handle = "h-0";
    ConnectActive(config);
    EXPECT_EQ(session_.resumption_token(), "h-0");

    upstream_->Push(ResumptionUpdate{"h-1", true});
    upstream_->Push(ResumptionUpdate{"", true});
    upstream_->Push(ResumptionUpdate{"h-2", false});
    upstream_->Push(TurnComplete{});
    ASSERT_TRUE(WaitUntil([this] { return listener_.turns() == 1; }));
    EXPECT_EQ(session_.resumption_token(), "h-1");
}

TEST_F(SessionManagerTest, TranscriptKeepsArrivalOrder) {
    ConnectActive(Config());
    upstream_->Push(TranscriptFragment{TranscriptRole::User, "add charts"});
    upstream_->Push(TranscriptFragment{TranscriptRole::Assistant, "Adding D3."});
    upstream_->Push(Interrupted{});
    ASSERT_TRUE(WaitUntil([this] { return listener_.interruptions() == 1; }));

    const std::vector<TranscriptEntry> transcript = session_.transcript();
    ASSERT_EQ(transcript.size(), 2u);
    EXPECT_EQ(transcript[0].role, TranscriptRole::User);
    EXPECT_EQ(transcript[0].text, "add charts");
    EXPECT_EQ(transcript[1].role, TranscriptRole::Assistant);
    EXPECT_LE(transcript[0].timestamp_ms, transcript[1].timestamp_ms);
    EXPECT_EQ(listener_.transcripts().size(), 2u);
}

TEST_F(SessionManagerTest, ModelAudioReachesListener) {
    ConnectActive(Config());
    upstream_->Push(AudioChunk{std::vector<std::int16_t>(480, 7)});
    EXPECT_TRUE(WaitUntil([this] { return listener_.audio_frames() == 1; }));
}

} // namespace
} // namespace voxrelay

#include "playback_queue.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

namespace voxrelay {
namespace {

std::vector<std::int16_t> Filled(std::size_t n, std::int16_t value) {
    return std::vector<std::int16_t>(n, value);
}

TEST(PlaybackQueueTest, DrainsInTagOrderRegardlessOfPushOrder) {
    PlaybackQueue queue;
    queue.Push(2, Filled(2, 3 * 1024));
    queue.Push(0, Filled(2, 1 * 1024));
    queue.Push(1, Filled(2, 2 * 1024));

    std::vector<float> out(6, -9.0f);
    ASSERT_EQ(queue.ReadFloat(out.data(), out.size()), 6u);
    EXPECT_FLOAT_EQ(out[0], 1024.0f / 32768.0f);
    EXPECT_FLOAT_EQ(out[1], 1024.0f / 32768.0f);
    EXPECT_FLOAT_EQ(out[2], 2048.0f / 32768.0f);
    EXPECT_FLOAT_EQ(out[3], 2048.0f / 32768.0f);
    EXPECT_FLOAT_EQ(out[4], 3072.0f / 32768.0f);
    EXPECT_FLOAT_EQ(out[5], 3072.0f / 32768.0f);
}

TEST(PlaybackQueueTest, SpeakingWhilePartiallyPlayed) {
    PlaybackQueue queue;
    EXPECT_FALSE(queue.IsSpeaking());
    queue.Push(0, Filled(4, 100));
    EXPECT_TRUE(queue.IsSpeaking());

    float out[3] = {};
    EXPECT_EQ(queue.ReadFloat(out, 3), 3u);
    EXPECT_TRUE(queue.IsSpeaking());
    EXPECT_EQ(queue.queued_buffers(), 0u);

    EXPECT_EQ(queue.ReadFloat(out, 3), 1u);
    EXPECT_FALSE(queue.IsSpeaking());
}

TEST(PlaybackQueueTest, ShortReadWhenEmpty) {
    PlaybackQueue queue;
    float out[8] = {};
    EXPECT_EQ(queue.ReadFloat(out, 8), 0u);
}

TEST(PlaybackQueueTest, FlushDropsQueuedAndPartialBuffers) {
    PlaybackQueue queue;
    queue.Push(0, Filled(4, 1));
    queue.Push(1, Filled(4, 2));
    float out[2] = {};
    queue.ReadFloat(out, 2);

    queue.Flush();
    EXPECT_FALSE(queue.IsSpeaking());
    EXPECT_EQ(queue.ReadFloat(out, 2), 0u);
}

TEST(PlaybackQueueTest, SpeakingChangedFiresOnTransitionsOnly) {
    PlaybackQueue queue;
    std::vector<bool> changes;
    queue.SetSpeakingChanged([&changes](bool speaking) { changes.push_back(speaking); });

    queue.Push(0, Filled(2, 1));
    queue.Push(1, Filled(2, 1));
    float out[4] = {};
    queue.ReadFloat(out, 4);
    queue.Flush();

    ASSERT_EQ(changes.size(), 2u);
    EXPECT_TRUE(changes[0]);
    EXPECT_FALSE(changes[1]);
}

TEST(PlaybackQueueTest, EmptyBuffersAreIgnored) {
    PlaybackQueue queue;
    queue.Push(0, {});
    EXPECT_FALSE(queue.IsSpeaking());
    EXPECT_EQ(queue.queued_buffers(), 0u);
}

} // namespace
} // namespace voxrelay

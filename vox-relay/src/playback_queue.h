#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <vector>

namespace voxrelay {

// Tag-ordered FIFO of received PCM buffers. Producers push from the network
// thread; a single audio-device consumer drains lowest tag first.
class PlaybackQueue {
public:
    using SpeakingChangedFn = std::function<void(bool speaking)>;

    void SetSpeakingChanged(SpeakingChangedFn callback);

    void Push(std::uint64_t tag, std::vector<std::int16_t> samples);

    // Writes up to `count` samples as floats in [-1, 1) and returns how many were
    // written. The caller pads the remainder with silence.
    std::size_t ReadFloat(float* out, std::size_t count);

    // Drops everything queued, including a partially played buffer.
    void Flush();

    // True while a buffer is queued or partially played.
    bool IsSpeaking() const;
    std::size_t queued_buffers() const;

private:
    bool SpeakingLocked() const;
    void NotifyIfChanged(bool before, bool after);

    mutable std::mutex mu_;
    std::map<std::uint64_t, std::vector<std::int16_t>> pending_;
    std::vector<std::int16_t> current_;
    std::size_t current_offset_ = 0;
    SpeakingChangedFn on_speaking_changed_;
};

} // namespace voxrelay

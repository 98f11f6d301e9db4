#include "playback_queue.h"

#include "audio_codec.h"

#include <algorithm>
#include <utility>

namespace voxrelay {

void PlaybackQueue::SetSpeakingChanged(SpeakingChangedFn callback) {
    std::lock_guard<std::mutex> lock(mu_);
    on_speaking_changed_ = std::move(callback);
}

void PlaybackQueue::Push(std::uint64_t tag, std::vector<std::int16_t> samples) {
    if (samples.empty()) {
        return;
    }
    bool before = false;
    bool after = false;
    {
        std::lock_guard<std::mutex> lock(mu_);
        before = SpeakingLocked();
        pending_[tag] = std::move(samples);
        after = SpeakingLocked();
    }
    NotifyIfChanged(before, after);
}

std::size_t PlaybackQueue::ReadFloat(float* out, std::size_t count) {
    if (!out || count == 0) {
        return 0;
    }
    std::size_t written = 0;
    bool before = false;
    bool after = false;
    {
        std::lock_guard<std::mutex> lock(mu_);
        before = SpeakingLocked();
        while (written < count) {
            if (current_offset_ >= current_.size()) {
                if (pending_.empty()) {
                    current_.clear();
                    current_offset_ = 0;
                    break;
                }
                auto first = pending_.begin();
                current_ = std::move(first->second);
                current_offset_ = 0;
                pending_.erase(first);
                continue;
            }
            const std::size_t n = std::min(count - written, current_.size() - current_offset_);
            Pcm16ToFloat(current_.data() + current_offset_, n, out + written);
            current_offset_ += n;
            written += n;
        }
        after = SpeakingLocked();
    }
    NotifyIfChanged(before, after);
    return written;
}

void PlaybackQueue::Flush() {
    bool before = false;
    {
        std::lock_guard<std::mutex> lock(mu_);
        before = SpeakingLocked();
        pending_.clear();
        current_.clear();
        current_offset_ = 0;
    }
    NotifyIfChanged(before, false);
}

bool PlaybackQueue::IsSpeaking() const {
    std::lock_guard<std::mutex> lock(mu_);
    return SpeakingLocked();
}

std::size_t PlaybackQueue::queued_buffers() const {
    std::lock_guard<std::mutex> lock(mu_);
    return pending_.size();
}

bool PlaybackQueue::SpeakingLocked() const {
    return !pending_.empty() || current_offset_ < current_.size();
}

void PlaybackQueue::NotifyIfChanged(bool before, bool after) {
    if (before == after) {
        return;
    }
    SpeakingChangedFn callback;
    {
        std::lock_guard<std::mutex> lock(mu_);
        callback = on_speaking_changed_;
    }
    if (callback) {
        callback(after);
    }
}

} // namespace voxrelay

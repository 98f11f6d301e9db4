#pragma once

#include "playback_queue.h"

#include <QAudioFormat>
#include <QIODevice>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class QAudioSink;

namespace voxrelay {

// Pull source handed to the audio sink. Drains the queue and pads with silence
// so the device never starves.
class PlaybackSource : public QIODevice {
public:
    PlaybackSource(PlaybackQueue& queue, QAudioFormat::SampleFormat sample_format);

    bool isSequential() const override { return true; }
    qint64 bytesAvailable() const override;

protected:
    qint64 readData(char* data, qint64 maxlen) override;
    qint64 writeData(const char* data, qint64 len) override;

private:
    PlaybackQueue& queue_;
    QAudioFormat::SampleFormat sample_format_;
    std::vector<float> scratch_;
};

// Speaker output at 24 kHz mono. Buffers are tagged with their arrival sequence
// number and played strictly in tag order.
class AudioPlayback {
public:
    using LogFn = std::function<void(const std::string&)>;

    AudioPlayback();
    ~AudioPlayback();

    AudioPlayback(const AudioPlayback&) = delete;
    AudioPlayback& operator=(const AudioPlayback&) = delete;

    void SetLogger(LogFn logger);
    void SetSpeakingChanged(PlaybackQueue::SpeakingChangedFn callback);

    bool Start(std::string* error);

    // Tags the buffer with the next arrival sequence number.
    void Enqueue(std::vector<std::int16_t> samples);

    // Flushes queued audio and keeps the device open.
    void Interrupt();

    // Flushes the queue and releases the device in one step.
    void Stop();

    bool IsRunning() const;
    bool IsSpeaking() const;

private:
    void Log(const std::string& msg) const;

    LogFn logger_;
    PlaybackQueue queue_;
    std::atomic<std::uint64_t> next_tag_{0};

    mutable std::mutex device_mu_;
    std::unique_ptr<PlaybackSource> source_;
    std::unique_ptr<QAudioSink> sink_;
};

} // namespace voxrelay

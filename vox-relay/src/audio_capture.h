#pragma once

#include <QAudioFormat>
#include <QByteArray>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

class QAudioSource;
class QIODevice;

namespace voxrelay {

// Microphone stream at 16 kHz mono. Every buffer is converted to s16 PCM and
// handed to the chunk handler unless muted. Start/Stop and device reads run on
// the Qt thread that owns the capture; SetMuted may be called from anywhere.
class AudioCapture {
public:
    using LogFn = std::function<void(const std::string&)>;
    using ChunkFn = std::function<void(std::vector<std::int16_t> samples)>;

    AudioCapture();
    ~AudioCapture();

    AudioCapture(const AudioCapture&) = delete;
    AudioCapture& operator=(const AudioCapture&) = delete;

    void SetLogger(LogFn logger);
    void SetChunkHandler(ChunkFn handler);

    bool Start(std::string* error);
    void Stop();
    bool IsRunning() const;

    void SetMuted(bool muted);
    bool muted() const;

    // Conversion and mute gate for one device buffer. Called by the device
    // reader; public so the gate can be driven without hardware.
    void ProcessSamples(const float* samples, std::size_t count);

    std::uint64_t sent_chunks() const;
    std::uint64_t muted_drops() const;

private:
    void OnReadyRead();
    void Log(const std::string& msg) const;

    LogFn logger_;
    ChunkFn on_chunk_;
    std::unique_ptr<QAudioSource> source_;
    QIODevice* io_ = nullptr;
    QAudioFormat::SampleFormat sample_format_ = QAudioFormat::Float;
    QByteArray partial_;
    std::atomic<bool> muted_{false};
    std::atomic<std::uint64_t> sent_chunks_{0};
    std::atomic<std::uint64_t> muted_drops_{0};
};

} // namespace voxrelay

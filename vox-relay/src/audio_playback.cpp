#include "audio_playback.h"

#include "audio_codec.h"

#include <QAudioDevice>
#include <QAudioSink>
#include <QMediaDevices>

#include <cstring>
#include <sstream>
#include <utility>

namespace voxrelay {

namespace {

constexpr int kPlaybackBufferMs = 100;
constexpr qint64 kAdvertisedBytes = 4096;

QAudioFormat MakePlaybackFormat(QAudioFormat::SampleFormat sample_format) {
    QAudioFormat format;
    format.setSampleRate(kOutboundSampleRate);
    format.setChannelCount(1);
    format.setSampleFormat(sample_format);
    return format;
}

} // namespace

PlaybackSource::PlaybackSource(PlaybackQueue& queue, QAudioFormat::SampleFormat sample_format)
    : queue_(queue), sample_format_(sample_format) {}

qint64 PlaybackSource::bytesAvailable() const {
    return kAdvertisedBytes + QIODevice::bytesAvailable();
}

qint64 PlaybackSource::readData(char* data, qint64 maxlen) {
    const qint64 sample_bytes = sample_format_ == QAudioFormat::Float ? static_cast<qint64>(sizeof(float)) : kBytesPerSample;
    const std::size_t count = static_cast<std::size_t>(maxlen / sample_bytes);
    if (count == 0) {
        return 0;
    }
    scratch_.assign(count, 0.0f);
    queue_.ReadFloat(scratch_.data(), count);

    if (sample_format_ == QAudioFormat::Float) {
        std::memcpy(data, scratch_.data(), count * sizeof(float));
    } else {
        const std::vector<std::int16_t> pcm = FloatToPcm16(scratch_.data(), count);
        const std::vector<std::uint8_t> bytes = EncodePcm16Le(pcm.data(), pcm.size());
        std::memcpy(data, bytes.data(), bytes.size());
    }
    return static_cast<qint64>(count) * sample_bytes;
}

qint64 PlaybackSource::writeData(const char*, qint64) {
    return -1;
}

AudioPlayback::AudioPlayback() = default;

AudioPlayback::~AudioPlayback() {
    Stop();
}

void AudioPlayback::SetLogger(LogFn logger) {
    logger_ = std::move(logger);
}

void AudioPlayback::SetSpeakingChanged(PlaybackQueue::SpeakingChangedFn callback) {
    queue_.SetSpeakingChanged(std::move(callback));
}

bool AudioPlayback::Start(std::string* error) {
    std::lock_guard<std::mutex> lock(device_mu_);
    if (sink_) {
        return true;
    }
    const QAudioDevice device = QMediaDevices::defaultAudioOutput();
    if (device.isNull()) {
        if (error) {
            *error = "no audio output device";
        }
        return false;
    }

    QAudioFormat format = MakePlaybackFormat(QAudioFormat::Float);
    if (!device.isFormatSupported(format)) {
        format = MakePlaybackFormat(QAudioFormat::Int16);
        if (!device.isFormatSupported(format)) {
            if (error) {
                *error = "output device does not support 24 kHz mono";
            }
            return false;
        }
    }

    source_ = std::make_unique<PlaybackSource>(queue_, format.sampleFormat());
    source_->open(QIODevice::ReadOnly);
    sink_ = std::make_unique<QAudioSink>(device, format);
    sink_->setBufferSize(format.bytesForDuration(kPlaybackBufferMs * 1000));
    sink_->start(source_.get());
    if (sink_->error() != QAudio::NoError) {
        if (error) {
            std::ostringstream oss;
            oss << "audio output start failed error=" << static_cast<int>(sink_->error());
            *error = oss.str();
        }
        sink_.reset();
        source_.reset();
        return false;
    }

    std::ostringstream oss;
    oss << "playback started device=" << device.description().toStdString()
        << " format=" << (format.sampleFormat() == QAudioFormat::Float ? "float" : "s16");
    Log(oss.str());
    return true;
}

void AudioPlayback::Enqueue(std::vector<std::int16_t> samples) {
    queue_.Push(next_tag_.fetch_add(1), std::move(samples));
}

void AudioPlayback::Interrupt() {
    queue_.Flush();
}

void AudioPlayback::Stop() {
    std::lock_guard<std::mutex> lock(device_mu_);
    queue_.Flush();
    if (!sink_) {
        return;
    }
    sink_->stop();
    sink_.reset();
    source_->close();
    source_.reset();
    Log("playback stopped");
}

bool AudioPlayback::IsRunning() const {
    std::lock_guard<std::mutex> lock(device_mu_);
    return sink_ != nullptr;
}

bool AudioPlayback::IsSpeaking() const {
    return queue_.IsSpeaking();
}

void AudioPlayback::Log(const std::string& msg) const {
    if (logger_) {
        logger_(msg);
    }
}

} // namespace voxrelay

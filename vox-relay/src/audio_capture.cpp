#include "audio_capture.h"

#include "audio_codec.h"

#include <QAudioDevice>
#include <QAudioSource>
#include <QIODevice>
#include <QMediaDevices>
#include <QObject>

#include <cstring>
#include <sstream>
#include <utility>

namespace voxrelay {

namespace {

constexpr int kCaptureBufferMs = 40;

QAudioFormat MakeCaptureFormat(QAudioFormat::SampleFormat sample_format) {
    QAudioFormat format;
    format.setSampleRate(kInboundSampleRate);
    format.setChannelCount(1);
    format.setSampleFormat(sample_format);
    return format;
}

} // namespace

AudioCapture::AudioCapture() = default;

AudioCapture::~AudioCapture() {
    Stop();
}

void AudioCapture::SetLogger(LogFn logger) {
    logger_ = std::move(logger);
}

void AudioCapture::SetChunkHandler(ChunkFn handler) {
    on_chunk_ = std::move(handler);
}

bool AudioCapture::Start(std::string* error) {
    if (source_) {
        return true;
    }
    const QAudioDevice device = QMediaDevices::defaultAudioInput();
    if (device.isNull()) {
        if (error) {
            *error = "no audio input device";
        }
        return false;
    }

    QAudioFormat format = MakeCaptureFormat(QAudioFormat::Float);
    if (!device.isFormatSupported(format)) {
        format = MakeCaptureFormat(QAudioFormat::Int16);
        if (!device.isFormatSupported(format)) {
            if (error) {
                *error = "input device does not support 16 kHz mono";
            }
            return false;
        }
    }
    sample_format_ = format.sampleFormat();

    source_ = std::make_unique<QAudioSource>(device, format);
    source_->setBufferSize(format.bytesForDuration(kCaptureBufferMs * 1000));
    io_ = source_->start();
    if (!io_ || source_->error() != QAudio::NoError) {
        if (error) {
            std::ostringstream oss;
            oss << "audio input start failed error=" << static_cast<int>(source_->error());
            *error = oss.str();
        }
        source_.reset();
        io_ = nullptr;
        return false;
    }
    QObject::connect(io_, &QIODevice::readyRead, io_, [this]() { OnReadyRead(); });

    std::ostringstream oss;
    oss << "capture started device=" << device.description().toStdString()
        << " format=" << (sample_format_ == QAudioFormat::Float ? "float" : "s16");
    Log(oss.str());
    return true;
}

void AudioCapture::Stop() {
    if (!source_) {
        return;
    }
    if (io_) {
        QObject::disconnect(io_, nullptr, nullptr, nullptr);
    }
    source_->stop();
    source_.reset();
    io_ = nullptr;
    partial_.clear();

    std::ostringstream oss;
    oss << "capture stopped sent_chunks=" << sent_chunks_.load() << " muted_drops=" << muted_drops_.load();
    Log(oss.str());
}

bool AudioCapture::IsRunning() const {
    return source_ != nullptr;
}

void AudioCapture::SetMuted(bool muted) {
    muted_.store(muted);
}

bool AudioCapture::muted() const {
    return muted_.load();
}

void AudioCapture::ProcessSamples(const float* samples, std::size_t count) {
    if (!samples || count == 0) {
        return;
    }
    if (muted_.load()) {
        muted_drops_.fetch_add(1);
        return;
    }
    std::vector<std::int16_t> pcm = FloatToPcm16(samples, count);
    sent_chunks_.fetch_add(1);
    if (on_chunk_) {
        on_chunk_(std::move(pcm));
    }
}

std::uint64_t AudioCapture::sent_chunks() const {
    return sent_chunks_.load();
}

std::uint64_t AudioCapture::muted_drops() const {
    return muted_drops_.load();
}

void AudioCapture::OnReadyRead() {
    if (!io_) {
        return;
    }
    partial_.append(io_->readAll());
    const int frame_bytes = sample_format_ == QAudioFormat::Float ? static_cast<int>(sizeof(float)) : kBytesPerSample;
    const qsizetype usable = partial_.size() - (partial_.size() % frame_bytes);
    if (usable <= 0) {
        return;
    }

    const std::size_t count = static_cast<std::size_t>(usable / frame_bytes);
    std::vector<float> samples(count);
    if (sample_format_ == QAudioFormat::Float) {
        std::memcpy(samples.data(), partial_.constData(), static_cast<std::size_t>(usable));
    } else {
        const std::vector<std::int16_t> pcm =
            DecodePcm16Le(reinterpret_cast<const std::uint8_t*>(partial_.constData()), static_cast<std::size_t>(usable));
        Pcm16ToFloat(pcm.data(), pcm.size(), samples.data());
    }
    partial_.remove(0, usable);
    ProcessSamples(samples.data(), samples.size());
}

void AudioCapture::Log(const std::string& msg) const {
    if (logger_) {
        logger_(msg);
    }
}

} // namespace voxrelay

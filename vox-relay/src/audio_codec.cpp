#include "audio_codec.h"

#include <algorithm>
#include <utility>

namespace voxrelay {

AudioFrame::AudioFrame(
    AudioDirection direction,
    std::string session_id,
    std::vector<std::int16_t> samples)
    : direction_(direction),
      session_id_(std::move(session_id)),
      samples_(std::move(samples)) {}

int AudioFrame::sample_rate() const {
    return direction_ == AudioDirection::Inbound ? kInboundSampleRate : kOutboundSampleRate;
}

double AudioFrame::duration_ms() const {
    return static_cast<double>(samples_.size()) * 1000.0 / static_cast<double>(sample_rate());
}

std::vector<std::uint8_t> AudioFrame::ToBytes() const {
    return EncodePcm16Le(samples_.data(), samples_.size());
}

AudioFrame AudioFrame::FromBytes(
    AudioDirection direction,
    const std::string& session_id,
    const std::uint8_t* data,
    std::size_t len) {
    return AudioFrame(direction, session_id, DecodePcm16Le(data, len));
}

std::int16_t FloatToPcm16(float sample) {
    const float s = std::max(-1.0f, std::min(1.0f, sample));
    // Asymmetric scale keeps -1.0 at INT16_MIN and +1.0 at INT16_MAX.
    if (s < 0.0f) {
        return static_cast<std::int16_t>(s * 32768.0f);
    }
    return static_cast<std::int16_t>(s * 32767.0f);
}

float Pcm16ToFloat(std::int16_t sample) {
    return static_cast<float>(sample) / 32768.0f;
}

std::vector<std::int16_t> FloatToPcm16(const float* samples, std::size_t count) {
    std::vector<std::int16_t> out;
    if (!samples) {
        return out;
    }
    out.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        out.push_back(FloatToPcm16(samples[i]));
    }
    return out;
}

void Pcm16ToFloat(const std::int16_t* samples, std::size_t count, float* out) {
    if (!samples || !out) {
        return;
    }
    for (std::size_t i = 0; i < count; ++i) {
        out[i] = Pcm16ToFloat(samples[i]);
    }
}

std::vector<std::int16_t> DecodePcm16Le(const std::uint8_t* data, std::size_t len) {
    std::vector<std::int16_t> out;
    if (!data) {
        return out;
    }
    const std::size_t count = len / kBytesPerSample;
    out.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        const std::uint16_t lo = data[i * 2];
        const std::uint16_t hi = data[i * 2 + 1];
        out.push_back(static_cast<std::int16_t>(lo | (hi << 8)));
    }
    return out;
}

std::vector<std::uint8_t> EncodePcm16Le(const std::int16_t* samples, std::size_t count) {
    std::vector<std::uint8_t> out;
    if (!samples) {
        return out;
    }
    out.reserve(count * kBytesPerSample);
    for (std::size_t i = 0; i < count; ++i) {
        const auto v = static_cast<std::uint16_t>(samples[i]);
        out.push_back(static_cast<std::uint8_t>(v & 0xff));
        out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xff));
    }
    return out;
}

} // namespace voxrelay

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace voxrelay {

constexpr int kInboundSampleRate = 16000;  // client microphone -> upstream
constexpr int kOutboundSampleRate = 24000; // upstream voice -> client speaker
constexpr int kBytesPerSample = 2;

enum class AudioDirection {
    Inbound,
    Outbound,
};

// Mono s16 PCM buffer. Built once by its producer and moved into the consumer.
class AudioFrame {
public:
    AudioFrame() = default;
    AudioFrame(AudioDirection direction, std::string session_id, std::vector<std::int16_t> samples);

    AudioDirection direction() const { return direction_; }
    const std::string& session_id() const { return session_id_; }
    const std::vector<std::int16_t>& samples() const { return samples_; }
    int sample_rate() const;
    bool empty() const { return samples_.empty(); }
    std::size_t byte_size() const { return samples_.size() * kBytesPerSample; }
    double duration_ms() const;

    // Little-endian wire bytes.
    std::vector<std::uint8_t> ToBytes() const;

    static AudioFrame FromBytes(
        AudioDirection direction,
        const std::string& session_id,
        const std::uint8_t* data,
        std::size_t len);

private:
    AudioDirection direction_ = AudioDirection::Inbound;
    std::string session_id_;
    std::vector<std::int16_t> samples_;
};

std::int16_t FloatToPcm16(float sample);
float Pcm16ToFloat(std::int16_t sample);

std::vector<std::int16_t> FloatToPcm16(const float* samples, std::size_t count);
void Pcm16ToFloat(const std::int16_t* samples, std::size_t count, float* out);

// A trailing odd byte is dropped.
std::vector<std::int16_t> DecodePcm16Le(const std::uint8_t* data, std::size_t len);
std::vector<std::uint8_t> EncodePcm16Le(const std::int16_t* samples, std::size_t count);

} // namespace voxrelay

#pragma once

#include <cstdint>
#include <cmath>
#include <cstring>
#include <span>
#include <vector>

// PCM16 mono WAV container for uploads to the transcription service.
namespace wav {

inline constexpr size_t kHeaderSize = 44;

inline std::vector<uint8_t> encode(std::span<const int16_t> samples, uint32_t sample_rate) {
    constexpr uint16_t channels = 1;
    constexpr uint16_t bits_per_sample = 16;
    const uint32_t data_size = static_cast<uint32_t>(samples.size_bytes());

    std::vector<uint8_t> out;
    out.reserve(kHeaderSize + data_size);

    auto put = [&out](const void* data, size_t len) {
        auto p = static_cast<const uint8_t*>(data);
        out.insert(out.end(), p, p + len);
    };
    auto put16 = [&put](uint16_t v) { put(&v, sizeof(v)); };
    auto put32 = [&put](uint32_t v) { put(&v, sizeof(v)); };

    put("RIFF", 4);
    put32(36 + data_size);
    put("WAVE", 4);

    put("fmt ", 4);
    put32(16);
    put16(1); // PCM
    put16(channels);
    put32(sample_rate);
    put32(sample_rate * channels * bits_per_sample / 8);
    put16(channels * bits_per_sample / 8);
    put16(bits_per_sample);

    put("data", 4);
    put32(data_size);
    put(samples.data(), data_size);

    return out;
}

// RMS of a block of samples, scaled to [0, 1].
inline float rms_level(std::span<const int16_t> samples) {
    if (samples.empty()) return 0.0f;
    double sum = 0.0;
    for (int16_t s : samples) {
        double v = static_cast<double>(s) / 32768.0;
        sum += v * v;
    }
    double rms = std::sqrt(sum / static_cast<double>(samples.size()));
    return rms > 1.0 ? 1.0f : static_cast<float>(rms);
}

} // namespace wav

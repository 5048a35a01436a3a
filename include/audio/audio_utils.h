#ifndef AUDIO_UTILS_H
#define AUDIO_UTILS_H

#include <cmath>
#include <cstddef>
#include <cstdint>

// Sample-level helpers shared by capture, resampling and voice activity detection

namespace AudioUtils {

// Downmix interleaved audio to mono by averaging channels: LRLR... -> M[]
inline void downmixToMono(const float* interleaved, float* mono, size_t frames, int channels) {
    if (channels <= 1) {
        for (size_t i = 0; i < frames; ++i) {
            mono[i] = interleaved[i];
        }
        return;
    }
    const float scale = 1.0f / static_cast<float>(channels);
    for (size_t i = 0; i < frames; ++i) {
        float sum = 0.0f;
        for (int ch = 0; ch < channels; ++ch) {
            sum += interleaved[i * static_cast<size_t>(channels) + static_cast<size_t>(ch)];
        }
        mono[i] = sum * scale;
    }
}

// Convert signed 16-bit PCM to float in [-1, 1)
inline void int16ToFloat(const int16_t* src, float* dst, size_t samples) {
    constexpr float kScale = 1.0f / 32768.0f;
    for (size_t i = 0; i < samples; ++i) {
        dst[i] = static_cast<float>(src[i]) * kScale;
    }
}

// Convert packed signed 24-bit little-endian PCM (3 bytes per sample) to float
inline void int24PackedToFloat(const uint8_t* src, float* dst, size_t samples) {
    constexpr float kScale = 1.0f / 8388608.0f;
    for (size_t i = 0; i < samples; ++i) {
        const uint8_t* p = src + i * 3;
        int32_t value = static_cast<int32_t>(p[0]) | (static_cast<int32_t>(p[1]) << 8) |
                        (static_cast<int32_t>(p[2]) << 16);
        if (value & 0x800000) {
            value |= ~0xFFFFFF;  // Sign-extend
        }
        dst[i] = static_cast<float>(value) * kScale;
    }
}

// Convert signed 32-bit PCM to float in [-1, 1)
inline void int32ToFloat(const int32_t* src, float* dst, size_t samples) {
    constexpr double kScale = 1.0 / 2147483648.0;
    for (size_t i = 0; i < samples; ++i) {
        dst[i] = static_cast<float>(static_cast<double>(src[i]) * kScale);
    }
}

// Root-mean-square amplitude; 0 for an empty block
inline float computeRms(const float* samples, size_t count) {
    if (!samples || count == 0) {
        return 0.0f;
    }
    double sum = 0.0;
    for (size_t i = 0; i < count; ++i) {
        const double v = samples[i];
        sum += v * v;
    }
    return static_cast<float>(std::sqrt(sum / static_cast<double>(count)));
}

inline float computePeak(const float* samples, size_t count) {
    if (!samples || count == 0) {
        return 0.0f;
    }
    float peak = 0.0f;
    for (size_t i = 0; i < count; ++i) {
        float value = std::fabs(samples[i]);
        if (value > peak) {
            peak = value;
        }
    }
    return peak;
}

// Replace NaN/Inf with silence. Returns the number of samples replaced.
inline size_t sanitizeNonFinite(float* samples, size_t count) {
    size_t replaced = 0;
    for (size_t i = 0; i < count; ++i) {
        if (!std::isfinite(samples[i])) {
            samples[i] = 0.0f;
            ++replaced;
        }
    }
    return replaced;
}

}  // namespace AudioUtils

#endif  // AUDIO_UTILS_H

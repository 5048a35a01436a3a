#ifndef RESAMPLER_H
#define RESAMPLER_H

#include "audio/lowpass_design.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace Resampler {

struct Config {
    int inputRate = 44100;
    int outputRate = 16000;
    Quality quality = Quality::High;
};

struct Stats {
    uint64_t chunksProcessed = 0;
    uint64_t samplesIn = 0;
    uint64_t samplesOut = 0;
    uint64_t fallbackCount = 0;  // Chunks that went through strided decimation
};

// Streaming rational resampler (polyphase FIR, up L / down M).
//
// The last (taps - 1) input samples of each chunk are carried into the next call, so a
// stream split into arbitrary chunks produces the same output as the concatenated stream.
// Not thread-safe: owned and called by a single context.
class StreamingResampler {
   public:
    // Throws DictationEngine::ConfigError for non-positive rates or a ratio whose
    // up factor exceeds the polyphase bank limit.
    explicit StreamingResampler(const Config& config);

    // Recompute ratio and filter for a new rate pair / quality. Clears carry-over state.
    void configure(int inputRate, int outputRate, Quality quality);

    // Resample one chunk. Empty input returns empty output.
    std::vector<float> resample(const std::vector<float>& chunk);
    std::vector<float> resample(const float* samples, size_t count);

    // floor(inputSize * outputRate / inputRate)
    size_t outputSize(size_t inputSize) const;

    // Clear carry-over samples and phase. Filter and ratio persist.
    void reset();

    int inputRate() const {
        return config_.inputRate;
    }
    int outputRate() const {
        return config_.outputRate;
    }
    Quality quality() const {
        return config_.quality;
    }
    int upFactor() const {
        return up_;
    }
    int downFactor() const {
        return down_;
    }
    size_t tapsPerPhase() const {
        return tapsPerPhase_;
    }
    bool isPassthrough() const {
        return up_ == down_;
    }
    // Number of input samples currently carried across chunk boundaries
    size_t carryOverSize() const {
        return history_.size();
    }

    const Stats& stats() const {
        return stats_;
    }

   private:
    std::vector<float> filterChunk(const float* samples, size_t count);
    std::vector<float> decimateFallback(const float* samples, size_t count) const;

    Config config_;
    int up_ = 1;
    int down_ = 1;
    size_t tapsPerPhase_ = 0;
    std::vector<float> bank_;     // up_ phases x tapsPerPhase_
    std::vector<float> history_;  // tapsPerPhase_ - 1 samples
    std::vector<float> work_;     // history + chunk scratch
    size_t pos_ = 0;              // Next output's input index relative to chunk start
    int phase_ = 0;               // Next output's polyphase index
    Stats stats_;
};

}  // namespace Resampler

#endif  // RESAMPLER_H

#include "audio/resampler.h"

#include "audio/audio_utils.h"
#include "core/dictation_constants.h"
#include "core/error_codes.h"
#include "logging/logger.h"

#include <algorithm>
#include <cmath>
#include <new>
#include <numeric>
#include <stdexcept>
#include <string>

namespace Resampler {

using DictationEngine::ConfigError;
using DictationEngine::ErrorCode;

StreamingResampler::StreamingResampler(const Config& config) : config_(config) {
    configure(config.inputRate, config.outputRate, config.quality);
}

void StreamingResampler::configure(int inputRate, int outputRate, Quality quality) {
    if (inputRate <= 0) {
        throw ConfigError(ErrorCode::AUDIO_INVALID_INPUT_RATE,
                          "input rate must be positive, got " + std::to_string(inputRate));
    }
    if (outputRate <= 0) {
        throw ConfigError(ErrorCode::AUDIO_INVALID_OUTPUT_RATE,
                          "output rate must be positive, got " + std::to_string(outputRate));
    }

    int up;
    int down;
    if (inputRate == 44100 && outputRate == 16000) {
        up = 160;
        down = 441;
    } else {
        const int g = std::gcd(inputRate, outputRate);
        up = outputRate / g;
        down = inputRate / g;
    }

    if (up > DictationConstants::MAX_POLYPHASE_PHASES) {
        throw ConfigError(ErrorCode::AUDIO_UNSUPPORTED_RATIO,
                          "unsupported rate combination " + std::to_string(inputRate) + " -> " +
                              std::to_string(outputRate) + " (up factor " + std::to_string(up) +
                              ")");
    }

    config_.inputRate = inputRate;
    config_.outputRate = outputRate;
    config_.quality = quality;
    up_ = up;
    down_ = down;
    tapsPerPhase_ = static_cast<size_t>(tapsForQuality(quality));

    if (up_ == down_) {
        bank_.clear();
        history_.clear();
    } else {
        // Prototype runs at the upsampled rate (up * inputRate). Cutoff at
        // min(inputRate, outputRate) / 2, gain `up` to make up for zero stuffing.
        const size_t prototypeTaps = tapsPerPhase_ * static_cast<size_t>(up_);
        const double cutoff = static_cast<double>(std::min(inputRate, outputRate)) / 2.0 /
                              (static_cast<double>(up_) * static_cast<double>(inputRate));
        const std::vector<double> prototype =
            designLowpass(prototypeTaps, cutoff, static_cast<double>(up_));
        bank_ = buildPolyphaseBank(prototype, static_cast<size_t>(up_), tapsPerPhase_);
        history_.assign(tapsPerPhase_ - 1, 0.0f);
    }
    pos_ = 0;
    phase_ = 0;

    LOG_DEBUG("Resampler: {} Hz -> {} Hz (up={}, down={}, quality={}, taps/phase={})",
              inputRate, outputRate, up_, down_, qualityToString(quality), tapsPerPhase_);
}

size_t StreamingResampler::outputSize(size_t inputSize) const {
    // Integer form of floor(n * out / in) to stay exact for long streams
    return static_cast<size_t>((static_cast<uint64_t>(inputSize) *
                                static_cast<uint64_t>(up_)) /
                               static_cast<uint64_t>(down_));
}

void StreamingResampler::reset() {
    std::fill(history_.begin(), history_.end(), 0.0f);
    pos_ = 0;
    phase_ = 0;
}

std::vector<float> StreamingResampler::resample(const std::vector<float>& chunk) {
    return resample(chunk.data(), chunk.size());
}

std::vector<float> StreamingResampler::resample(const float* samples, size_t count) {
    if (!samples || count == 0) {
        return {};
    }

    stats_.chunksProcessed++;
    stats_.samplesIn += count;

    if (isPassthrough()) {
        std::vector<float> out(samples, samples + count);
        stats_.samplesOut += out.size();
        return out;
    }

    std::vector<float> out;
    bool ok = false;
    try {
        out = filterChunk(samples, count);
        ok = std::all_of(out.begin(), out.end(), [](float v) { return std::isfinite(v); });
        if (!ok) {
            LOG_EVERY_N(WARN, 100,
                        "Resampler: non-finite output in {}-sample chunk, using decimation",
                        count);
        }
    } catch (const std::bad_alloc& e) {
        LOG_EVERY_N(WARN, 100, "Resampler: filter allocation failed ({}), using decimation",
                    e.what());
    } catch (const std::exception& e) {
        LOG_EVERY_N(WARN, 100, "Resampler: filter failed ({}), using decimation", e.what());
    }

    if (!ok) {
        // Filter state is suspect after a failure; start the next chunk clean
        reset();
        out = decimateFallback(samples, count);
        stats_.fallbackCount++;
    }

    stats_.samplesOut += out.size();
    return out;
}

std::vector<float> StreamingResampler::filterChunk(const float* samples, size_t count) {
    const size_t hist = history_.size();
    const size_t taps = tapsPerPhase_;
    const size_t up = static_cast<size_t>(up_);
    const size_t down = static_cast<size_t>(down_);

    work_.resize(hist + count);
    std::copy(history_.begin(), history_.end(), work_.begin());
    std::copy(samples, samples + count, work_.begin() + static_cast<std::ptrdiff_t>(hist));

    std::vector<float> out;
    out.reserve(outputSize(count) + 1);

    size_t pos = pos_;
    size_t phase = static_cast<size_t>(phase_);
    while (pos < count) {
        // Newest contributing sample is work_[hist + pos], oldest is work_[hist + pos - taps + 1]
        const float* coeffs = &bank_[phase * taps];
        const float* x = &work_[hist + pos];
        double acc = 0.0;
        for (size_t j = 0; j < taps; ++j) {
            acc += static_cast<double>(*(x - j)) * static_cast<double>(coeffs[j]);
        }
        out.push_back(static_cast<float>(acc));

        phase += down;
        pos += phase / up;
        phase %= up;
    }

    pos_ = pos - count;
    phase_ = static_cast<int>(phase);
    std::copy(work_.end() - static_cast<std::ptrdiff_t>(hist), work_.end(), history_.begin());
    return out;
}

std::vector<float> StreamingResampler::decimateFallback(const float* samples,
                                                         size_t count) const {
    // Pick the nearest input sample for each output position (stride in/out)
    const double step = static_cast<double>(down_) / static_cast<double>(up_);
    std::vector<float> out;
    out.reserve(static_cast<size_t>(static_cast<double>(count) / step) + 1);
    for (size_t k = 0;; ++k) {
        const double position = static_cast<double>(k) * step;
        if (position >= static_cast<double>(count)) {
            break;
        }
        size_t index = static_cast<size_t>(std::lround(position));
        if (index >= count) {
            index = count - 1;
        }
        out.push_back(samples[index]);
    }
    const size_t replaced = AudioUtils::sanitizeNonFinite(out.data(), out.size());
    LOG_IF(WARN, replaced > 0, "Resampler: replaced {} non-finite samples with silence",
           replaced);
    return out;
}

}  // namespace Resampler

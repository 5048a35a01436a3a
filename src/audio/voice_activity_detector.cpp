#include "audio/voice_activity_detector.h"

#include "audio/audio_utils.h"
#include "core/error_codes.h"
#include "logging/logger.h"

#include <cmath>
#include <string>
#include <utility>

namespace VoiceActivity {

using DictationEngine::ConfigError;
using DictationEngine::ErrorCode;

Detector::Detector(const Config& config, ClockFn clock)
    : config_(config), clock_(std::move(clock)) {
    if (config_.sampleRate <= 0) {
        throw ConfigError(ErrorCode::AUDIO_INVALID_INPUT_RATE,
                          "VAD sample rate must be positive, got " +
                              std::to_string(config_.sampleRate));
    }
    if (config_.frameDurationMs <= 0) {
        throw ConfigError(ErrorCode::VAD_INVALID_FRAME_DURATION,
                          "frame duration must be positive, got " +
                              std::to_string(config_.frameDurationMs) + " ms");
    }
    const int64_t frameSamples =
        static_cast<int64_t>(config_.sampleRate) * config_.frameDurationMs / 1000;
    if (frameSamples < 1) {
        throw ConfigError(ErrorCode::VAD_INVALID_FRAME_DURATION,
                          "frame of " + std::to_string(config_.frameDurationMs) + " ms at " +
                              std::to_string(config_.sampleRate) + " Hz holds no samples");
    }
    if (!std::isfinite(config_.silenceThreshold) || config_.silenceThreshold < 0.0f) {
        throw ConfigError(ErrorCode::VAD_INVALID_THRESHOLD,
                          "silence threshold must be a non-negative number");
    }
    if (config_.pauseThresholdMs <= 0) {
        throw ConfigError(ErrorCode::VAD_INVALID_PAUSE_THRESHOLD,
                          "pause threshold must be positive, got " +
                              std::to_string(config_.pauseThresholdMs) + " ms");
    }

    frameSize_ = static_cast<size_t>(frameSamples);
    pauseThresholdSec_ = static_cast<double>(config_.pauseThresholdMs) / 1000.0;
    if (!clock_) {
        clock_ = [] { return Clock::now(); };
    }
}

void Detector::setCallbacks(Callbacks callbacks) {
    callbacks_ = std::move(callbacks);
}

Status Detector::process(const float* samples, size_t count) {
    return process(samples, count, clock_());
}

Status Detector::process(const std::vector<float>& frame) {
    return process(frame.data(), frame.size(), clock_());
}

Status Detector::process(const float* samples, size_t count, Clock::time_point now) {
    Status status;
    // Empty frames count as silence with zero energy
    status.rmsEnergy = AudioUtils::computeRms(samples, count);
    status.isSpeech = status.rmsEnergy > config_.silenceThreshold;
    LOG_TRACE("VAD: frame rms={:.5f} speech={}", status.rmsEnergy, status.isSpeech);

    if (status.isSpeech) {
        silenceStart_.reset();
        lastSpeechTime_ = now;
        if (!isSpeaking_) {
            isSpeaking_ = true;
            ++utteranceCount_;
            LOG_DEBUG("VAD: speech start (rms={:.4f})", status.rmsEnergy);
            if (callbacks_.onSpeechStart) {
                callbacks_.onSpeechStart();
            }
        }
        status.isSpeaking = true;
        return status;
    }

    if (!isSpeaking_) {
        status.isSpeaking = false;
        return status;
    }

    if (!silenceStart_) {
        silenceStart_ = now;
    }
    status.pauseDuration = std::chrono::duration<double>(now - *silenceStart_).count();

    if (status.pauseDuration >= pauseThresholdSec_) {
        isSpeaking_ = false;
        silenceStart_.reset();
        LOG_DEBUG("VAD: speech end after {:.3f}s pause", status.pauseDuration);
        if (callbacks_.onPauseDetected) {
            callbacks_.onPauseDetected(status.pauseDuration);
        }
        if (callbacks_.onSpeechEnd) {
            callbacks_.onSpeechEnd();
        }
    }

    status.isSpeaking = isSpeaking_;
    return status;
}

void Detector::reset() {
    isSpeaking_ = false;
    silenceStart_.reset();
    lastSpeechTime_.reset();
}

}  // namespace VoiceActivity

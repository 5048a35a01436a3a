#ifndef VOICE_ACTIVITY_DETECTOR_H
#define VOICE_ACTIVITY_DETECTOR_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace VoiceActivity {

using Clock = std::chrono::steady_clock;

struct Config {
    int sampleRate = 16000;
    int frameDurationMs = 30;
    float silenceThreshold = 0.01f;  // RMS at or below this is silence
    int pauseThresholdMs = 1500;     // Continuous silence that ends an utterance
};

// Per-frame result, returned whether or not a transition fired
struct Status {
    bool isSpeech = false;
    float rmsEnergy = 0.0f;
    double pauseDuration = 0.0;  // Seconds of silence since the candidate pause began
    bool isSpeaking = false;
};

struct Callbacks {
    std::function<void()> onSpeechStart;
    std::function<void()> onSpeechEnd;
    std::function<void(double pauseSeconds)> onPauseDetected;
};

// Energy-based voice activity detector.
//
// Two states (Silent, Speaking). A frame whose RMS exceeds the silence threshold is speech.
// While Speaking, continuous silence of at least pauseThresholdMs returns to Silent, firing
// onPauseDetected then onSpeechEnd. Callbacks run synchronously on the calling thread.
// Not thread-safe: driven by the capture context only.
class Detector {
   public:
    using ClockFn = std::function<Clock::time_point()>;

    // Throws DictationEngine::ConfigError when the configuration is invalid.
    explicit Detector(const Config& config, ClockFn clock = {});

    void setCallbacks(Callbacks callbacks);

    // Classify one frame using the detector's clock
    Status process(const float* samples, size_t count);
    Status process(const std::vector<float>& frame);

    // Classify one frame at an explicit timestamp (stream time or tests)
    Status process(const float* samples, size_t count, Clock::time_point now);

    // Back to Silent with no pending pause. No events fire.
    void reset();

    bool isSpeaking() const {
        return isSpeaking_;
    }
    bool hasPendingPause() const {
        return silenceStart_.has_value();
    }
    std::optional<Clock::time_point> lastSpeechTime() const {
        return lastSpeechTime_;
    }

    // Samples per frame at the configured rate
    size_t frameSize() const {
        return frameSize_;
    }
    const Config& config() const {
        return config_;
    }

    uint64_t utteranceCount() const {
        return utteranceCount_;
    }

   private:
    Config config_;
    ClockFn clock_;
    Callbacks callbacks_;
    size_t frameSize_ = 0;
    double pauseThresholdSec_ = 0.0;

    bool isSpeaking_ = false;
    // Set only while speaking and the current run of frames is silent
    std::optional<Clock::time_point> silenceStart_;
    std::optional<Clock::time_point> lastSpeechTime_;
    uint64_t utteranceCount_ = 0;
};

}  // namespace VoiceActivity

#endif  // VOICE_ACTIVITY_DETECTOR_H

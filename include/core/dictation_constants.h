#ifndef DICTATION_CONSTANTS_H
#define DICTATION_CONSTANTS_H

#include <cstddef>  // for size_t

// Defaults shared across pipeline components

namespace DictationConstants {

// Audio format
constexpr int DEFAULT_CAPTURE_SAMPLE_RATE = 44100;
constexpr int MODEL_SAMPLE_RATE = 16000;  // Rate the recognizer expects
constexpr int DEFAULT_CAPTURE_CHANNELS = 1;
constexpr int DEFAULT_CAPTURE_PERIOD_FRAMES = 1024;

// Resampler
constexpr int FAST_FILTER_TAPS = 64;
constexpr int BALANCED_FILTER_TAPS = 128;
constexpr int HIGH_FILTER_TAPS = 256;
// Polyphase bank size limit (up factor). 44.1k->16k needs 160.
constexpr int MAX_POLYPHASE_PHASES = 4096;

// Voice activity detection
constexpr int DEFAULT_FRAME_DURATION_MS = 30;
constexpr float DEFAULT_SILENCE_THRESHOLD = 0.01f;
constexpr int DEFAULT_PAUSE_THRESHOLD_MS = 1500;
constexpr int DEFAULT_MAX_SEGMENT_MS = 30000;

// Correction engine
constexpr double CORRECTION_TARGET_LATENCY_MS = 50.0;
constexpr float CONFIDENCE_CORRECTED = 0.9f;
constexpr float CONFIDENCE_UNCHANGED = 0.8f;
constexpr float CONFIDENCE_FAILED = 0.0f;
constexpr size_t DEFAULT_CORRECTION_QUEUE_CAPACITY = 64;
constexpr size_t DEFAULT_MAX_TEXT_LENGTH = 64 * 1024;

// Text injection
constexpr int DEFAULT_STRATEGY_TIMEOUT_MS = 1000;
constexpr int DEFAULT_RESTORE_DELAY_MS = 1000;
constexpr int DEFAULT_CLIPBOARD_SETTLE_MS = 50;
constexpr int CLIPBOARD_COMMAND_TIMEOUT_MS = 1000;

// Recognizer
constexpr int DEFAULT_RECOGNIZER_TIMEOUT_MS = 30000;
constexpr size_t DEFAULT_RECOGNIZER_QUEUE_CAPACITY = 16;

}  // namespace DictationConstants

#endif  // DICTATION_CONSTANTS_H

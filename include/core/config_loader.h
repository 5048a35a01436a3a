#ifndef CONFIG_LOADER_H
#define CONFIG_LOADER_H

#include "audio/resampler.h"
#include "audio/voice_activity_detector.h"
#include "core/dictation_constants.h"
#include "correction/correction_engine.h"
#include "injection/injection_manager.h"
#include "logging/logger.h"

#include <filesystem>
#include <string>
#include <vector>

constexpr const char* DEFAULT_CONFIG_FILE = "config.json";

struct AppConfig {
    struct LoggingConfig {
        std::string level = "info";
        std::string filePath = "";  // Empty = console only
        size_t maxFileSizeMb = 5;
        size_t maxBackups = 3;
        bool console = true;
        bool colored = true;
    } logging;

    struct CaptureConfig {
        std::string device = "default";
        int sampleRate = DictationConstants::DEFAULT_CAPTURE_SAMPLE_RATE;
        int channels = DictationConstants::DEFAULT_CAPTURE_CHANNELS;
        std::string format = "S16_LE";  // Supported: S16_LE, S24_3LE, S32_LE
        int periodFrames = DictationConstants::DEFAULT_CAPTURE_PERIOD_FRAMES;
    } capture;

    // inputRate 0 = follow the capture (or input file) rate
    Resampler::Config resampler{0, DictationConstants::MODEL_SAMPLE_RATE, Resampler::Quality::High};

    // sampleRate is taken from resampler.outputRate
    VoiceActivity::Config vad;
    int maxSegmentMs = DictationConstants::DEFAULT_MAX_SEGMENT_MS;

    Correction::EngineConfig correction;

    struct InjectionSection {
        std::string platform = "auto";        // auto, wayland, x11, macos, windows
        std::vector<std::string> strategies;  // Empty = platform default order
        TextInjection::InjectionConfig timing;
    } injection;

    struct RecognizerConfig {
        std::string command = "";
        int timeoutMs = DictationConstants::DEFAULT_RECOGNIZER_TIMEOUT_MS;
        size_t queueCapacity = DictationConstants::DEFAULT_RECOGNIZER_QUEUE_CAPACITY;
    } recognizer;
};

// Logging section -> logger settings
dictation::logging::LogConfig toLogConfig(const AppConfig::LoggingConfig& logging);

// Load JSON configuration. Missing or malformed files return false and leave
// `outConfig` at defaults; out-of-range values are replaced by defaults with a warning.
bool loadAppConfig(const std::filesystem::path& configPath, AppConfig& outConfig,
                   bool verbose = true);

#endif  // CONFIG_LOADER_H

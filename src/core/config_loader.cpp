#include "core/config_loader.h"

#include "audio/lowpass_design.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <nlohmann/json.hpp>

static std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

static bool isSupportedCaptureFormat(const std::string& format) {
    std::string lower = toLower(format);
    return lower == "s16_le" || lower == "s24_3le" || lower == "s32_le";
}

dictation::logging::LogConfig toLogConfig(const AppConfig::LoggingConfig& logging) {
    dictation::logging::LogConfig config;
    config.level = dictation::logging::stringToLevel(logging.level);
    config.filePath = logging.filePath;
    config.maxFileSize = logging.maxFileSizeMb * 1024 * 1024;
    config.maxBackups = logging.maxBackups;
    config.consoleOutput = logging.console;
    config.coloredOutput = logging.colored;
    return config;
}

bool loadAppConfig(const std::filesystem::path& configPath, AppConfig& outConfig, bool verbose) {
    outConfig = AppConfig{};

    std::ifstream file(configPath);
    if (!file.is_open()) {
        if (verbose) {
            LOG_INFO("Config: {} not found, using defaults", configPath.string());
        }
        return false;
    }

    try {
        nlohmann::json j;
        file >> j;

        if (j.contains("logging") && j["logging"].is_object()) {
            auto logging = j["logging"];
            try {
                if (logging.contains("level") && logging["level"].is_string()) {
                    std::string level = logging["level"].get<std::string>();
                    if (dictation::logging::isKnownLevel(level)) {
                        outConfig.logging.level = toLower(level);
                    } else if (verbose) {
                        LOG_WARN("Config: Unknown logging.level '{}', using 'info'", level);
                    }
                }
                if (logging.contains("filePath") && logging["filePath"].is_string()) {
                    outConfig.logging.filePath = logging["filePath"].get<std::string>();
                }
                if (logging.contains("maxFileSizeMb") &&
                    logging["maxFileSizeMb"].is_number_unsigned()) {
                    outConfig.logging.maxFileSizeMb =
                        std::max<size_t>(1, logging["maxFileSizeMb"].get<size_t>());
                }
                if (logging.contains("maxBackups") && logging["maxBackups"].is_number_unsigned()) {
                    outConfig.logging.maxBackups = logging["maxBackups"].get<size_t>();
                }
                if (logging.contains("console") && logging["console"].is_boolean()) {
                    outConfig.logging.console = logging["console"].get<bool>();
                }
                if (logging.contains("colored") && logging["colored"].is_boolean()) {
                    outConfig.logging.colored = logging["colored"].get<bool>();
                }
            } catch (const std::exception& e) {
                if (verbose) {
                    LOG_WARN("Config: Invalid logging settings, using defaults: {}", e.what());
                }
                outConfig.logging = AppConfig::LoggingConfig{};
            }
        }

        if (j.contains("capture") && j["capture"].is_object()) {
            auto capture = j["capture"];
            try {
                if (capture.contains("device") && capture["device"].is_string()) {
                    outConfig.capture.device = capture["device"].get<std::string>();
                }
                if (capture.contains("sampleRate") && capture["sampleRate"].is_number_integer()) {
                    outConfig.capture.sampleRate = capture["sampleRate"].get<int>();
                }
                if (capture.contains("channels") && capture["channels"].is_number_integer()) {
                    outConfig.capture.channels = capture["channels"].get<int>();
                }
                if (capture.contains("format") && capture["format"].is_string()) {
                    outConfig.capture.format = capture["format"].get<std::string>();
                }
                if (capture.contains("periodFrames") &&
                    capture["periodFrames"].is_number_integer()) {
                    outConfig.capture.periodFrames = capture["periodFrames"].get<int>();
                }
            } catch (const std::exception& e) {
                if (verbose) {
                    LOG_WARN("Config: Invalid capture settings, using defaults: {}", e.what());
                }
                outConfig.capture = AppConfig::CaptureConfig{};
            }
        }

        if (j.contains("resampler") && j["resampler"].is_object()) {
            auto resampler = j["resampler"];
            try {
                if (resampler.contains("inputRate") &&
                    resampler["inputRate"].is_number_integer()) {
                    outConfig.resampler.inputRate = resampler["inputRate"].get<int>();
                }
                if (resampler.contains("outputRate") &&
                    resampler["outputRate"].is_number_integer()) {
                    outConfig.resampler.outputRate = resampler["outputRate"].get<int>();
                }
                if (resampler.contains("quality") && resampler["quality"].is_string()) {
                    std::string quality = resampler["quality"].get<std::string>();
                    if (!Resampler::isKnownQuality(quality) && verbose) {
                        LOG_WARN("Config: Unknown resampler.quality '{}', using 'high'", quality);
                    }
                    outConfig.resampler.quality = Resampler::parseQuality(quality);
                }
            } catch (const std::exception& e) {
                if (verbose) {
                    LOG_WARN("Config: Invalid resampler settings, using defaults: {}", e.what());
                }
                outConfig.resampler = AppConfig{}.resampler;
            }
        }

        if (j.contains("vad") && j["vad"].is_object()) {
            auto vad = j["vad"];
            try {
                if (vad.contains("frameDurationMs") && vad["frameDurationMs"].is_number_integer()) {
                    outConfig.vad.frameDurationMs = vad["frameDurationMs"].get<int>();
                }
                if (vad.contains("silenceThreshold") && vad["silenceThreshold"].is_number()) {
                    outConfig.vad.silenceThreshold = vad["silenceThreshold"].get<float>();
                }
                if (vad.contains("pauseThresholdMs") &&
                    vad["pauseThresholdMs"].is_number_integer()) {
                    outConfig.vad.pauseThresholdMs = vad["pauseThresholdMs"].get<int>();
                }
                if (vad.contains("maxSegmentMs") && vad["maxSegmentMs"].is_number_integer()) {
                    outConfig.maxSegmentMs = vad["maxSegmentMs"].get<int>();
                }
            } catch (const std::exception& e) {
                if (verbose) {
                    LOG_WARN("Config: Invalid vad settings, using defaults: {}", e.what());
                }
                outConfig.vad = VoiceActivity::Config{};
                outConfig.maxSegmentMs = DictationConstants::DEFAULT_MAX_SEGMENT_MS;
            }
        }

        if (j.contains("correction") && j["correction"].is_object()) {
            auto correction = j["correction"];
            try {
                if (correction.contains("enableRuleBased") &&
                    correction["enableRuleBased"].is_boolean()) {
                    outConfig.correction.enableRuleBased =
                        correction["enableRuleBased"].get<bool>();
                }
                if (correction.contains("queueCapacity") &&
                    correction["queueCapacity"].is_number_unsigned()) {
                    outConfig.correction.queueCapacity =
                        correction["queueCapacity"].get<size_t>();
                }
                if (correction.contains("maxTextLength") &&
                    correction["maxTextLength"].is_number_unsigned()) {
                    outConfig.correction.maxTextLength =
                        correction["maxTextLength"].get<size_t>();
                }
            } catch (const std::exception& e) {
                if (verbose) {
                    LOG_WARN("Config: Invalid correction settings, using defaults: {}", e.what());
                }
                outConfig.correction = Correction::EngineConfig{};
            }
        }

        if (j.contains("injection") && j["injection"].is_object()) {
            auto injection = j["injection"];
            try {
                if (injection.contains("platform") && injection["platform"].is_string()) {
                    std::string platform = toLower(injection["platform"].get<std::string>());
                    if (platform == "auto" || TextInjection::parsePlatformFamily(platform)) {
                        outConfig.injection.platform = platform;
                    } else if (verbose) {
                        LOG_WARN("Config: Unknown injection.platform '{}', using 'auto'",
                                 platform);
                    }
                }
                if (injection.contains("strategies") && injection["strategies"].is_array()) {
                    outConfig.injection.strategies =
                        injection["strategies"].get<std::vector<std::string>>();
                }
                auto& timing = outConfig.injection.timing;
                if (injection.contains("strategyTimeoutMs") &&
                    injection["strategyTimeoutMs"].is_number_integer()) {
                    timing.strategyTimeoutMs = injection["strategyTimeoutMs"].get<int>();
                }
                if (injection.contains("restoreDelayMs") &&
                    injection["restoreDelayMs"].is_number_integer()) {
                    timing.restoreDelayMs = injection["restoreDelayMs"].get<int>();
                }
                if (injection.contains("clipboardSettleMs") &&
                    injection["clipboardSettleMs"].is_number_integer()) {
                    timing.clipboardSettleMs = injection["clipboardSettleMs"].get<int>();
                }
                if (injection.contains("appendTrailingSpace") &&
                    injection["appendTrailingSpace"].is_boolean()) {
                    timing.appendTrailingSpace = injection["appendTrailingSpace"].get<bool>();
                }
            } catch (const std::exception& e) {
                if (verbose) {
                    LOG_WARN("Config: Invalid injection settings, using defaults: {}", e.what());
                }
                outConfig.injection = AppConfig::InjectionSection{};
            }
        }

        if (j.contains("recognizer") && j["recognizer"].is_object()) {
            auto recognizer = j["recognizer"];
            try {
                if (recognizer.contains("command") && recognizer["command"].is_string()) {
                    outConfig.recognizer.command = recognizer["command"].get<std::string>();
                }
                if (recognizer.contains("timeoutMs") &&
                    recognizer["timeoutMs"].is_number_integer()) {
                    outConfig.recognizer.timeoutMs = recognizer["timeoutMs"].get<int>();
                }
                if (recognizer.contains("queueCapacity") &&
                    recognizer["queueCapacity"].is_number_unsigned()) {
                    outConfig.recognizer.queueCapacity =
                        recognizer["queueCapacity"].get<size_t>();
                }
            } catch (const std::exception& e) {
                if (verbose) {
                    LOG_WARN("Config: Invalid recognizer settings, using defaults: {}", e.what());
                }
                outConfig.recognizer = AppConfig::RecognizerConfig{};
            }
        }

        // Sanitize ranges so component constructors never see values they reject
        const AppConfig defaults;
        if (outConfig.capture.sampleRate <= 0) {
            if (verbose) {
                LOG_WARN("Config: capture.sampleRate {} invalid, using {}",
                         outConfig.capture.sampleRate, defaults.capture.sampleRate);
            }
            outConfig.capture.sampleRate = defaults.capture.sampleRate;
        }
        if (outConfig.capture.channels < 1) {
            if (verbose) {
                LOG_WARN("Config: capture.channels {} invalid, using {}",
                         outConfig.capture.channels, defaults.capture.channels);
            }
            outConfig.capture.channels = defaults.capture.channels;
        }
        if (!isSupportedCaptureFormat(outConfig.capture.format)) {
            if (verbose) {
                LOG_WARN("Config: Unsupported capture.format '{}', using '{}'",
                         outConfig.capture.format, defaults.capture.format);
            }
            outConfig.capture.format = defaults.capture.format;
        }
        if (outConfig.capture.periodFrames <= 0) {
            outConfig.capture.periodFrames = defaults.capture.periodFrames;
        }
        if (outConfig.resampler.inputRate < 0) {
            if (verbose) {
                LOG_WARN("Config: resampler.inputRate {} invalid, following capture rate",
                         outConfig.resampler.inputRate);
            }
            outConfig.resampler.inputRate = 0;
        }
        if (outConfig.resampler.outputRate <= 0) {
            if (verbose) {
                LOG_WARN("Config: resampler.outputRate {} invalid, using {}",
                         outConfig.resampler.outputRate, defaults.resampler.outputRate);
            }
            outConfig.resampler.outputRate = defaults.resampler.outputRate;
        }
        if (outConfig.vad.frameDurationMs <= 0) {
            if (verbose) {
                LOG_WARN("Config: vad.frameDurationMs {} invalid, using {}",
                         outConfig.vad.frameDurationMs, defaults.vad.frameDurationMs);
            }
            outConfig.vad.frameDurationMs = defaults.vad.frameDurationMs;
        }
        if (!(outConfig.vad.silenceThreshold >= 0.0f && outConfig.vad.silenceThreshold <= 1.0f)) {
            if (verbose) {
                LOG_WARN("Config: vad.silenceThreshold {} out of range [0, 1], using {}",
                         outConfig.vad.silenceThreshold, defaults.vad.silenceThreshold);
            }
            outConfig.vad.silenceThreshold = defaults.vad.silenceThreshold;
        }
        if (outConfig.vad.pauseThresholdMs <= 0) {
            if (verbose) {
                LOG_WARN("Config: vad.pauseThresholdMs {} invalid, using {}",
                         outConfig.vad.pauseThresholdMs, defaults.vad.pauseThresholdMs);
            }
            outConfig.vad.pauseThresholdMs = defaults.vad.pauseThresholdMs;
        }
        if (outConfig.maxSegmentMs < outConfig.vad.frameDurationMs) {
            if (verbose) {
                LOG_WARN("Config: vad.maxSegmentMs {} shorter than one frame, using {}",
                         outConfig.maxSegmentMs, defaults.maxSegmentMs);
            }
            outConfig.maxSegmentMs = defaults.maxSegmentMs;
        }
        if (outConfig.correction.queueCapacity == 0) {
            outConfig.correction.queueCapacity = defaults.correction.queueCapacity;
        }
        if (outConfig.correction.maxTextLength == 0) {
            outConfig.correction.maxTextLength = defaults.correction.maxTextLength;
        }
        auto& timing = outConfig.injection.timing;
        timing.strategyTimeoutMs = std::clamp(timing.strategyTimeoutMs, 10, 10000);
        timing.restoreDelayMs = std::clamp(timing.restoreDelayMs, 0, 60000);
        timing.clipboardSettleMs = std::clamp(timing.clipboardSettleMs, 0, 1000);
        if (outConfig.recognizer.timeoutMs <= 0) {
            outConfig.recognizer.timeoutMs = defaults.recognizer.timeoutMs;
        }
        if (outConfig.recognizer.queueCapacity == 0) {
            outConfig.recognizer.queueCapacity = defaults.recognizer.queueCapacity;
        }

        if (verbose) {
            LOG_INFO("Config: loaded {}", configPath.string());
        }
        return true;
    } catch (const std::exception& e) {
        if (verbose) {
            LOG_ERROR("Config: Failed to parse {}: {}", configPath.string(), e.what());
        }
        outConfig = AppConfig{};
        return false;
    }
}

#ifndef ERROR_CODES_H
#define ERROR_CODES_H

#include <cstdint>
#include <stdexcept>
#include <string>

namespace DictationEngine {

/**
 * @brief Error codes for the dictation pipeline.
 *
 * Categories use the 0xF000 mask:
 * - 0x1xxx: Audio / Resampler
 * - 0x2xxx: Voice activity detection
 * - 0x3xxx: Correction engine
 * - 0x4xxx: Text injection / clipboard
 * - 0x5xxx: Validation (configuration)
 * - 0x6xxx: Recognizer
 * - 0xFxxx: Internal (reserved)
 *
 * Only validation errors reach callers as exceptions; everything else is recovered
 * locally and shows up in logs and outcome records.
 */
enum class ErrorCode : uint32_t {
    OK = 0,

    // Audio / Resampler (0x1000)
    AUDIO_INVALID_INPUT_RATE = 0x1001,
    AUDIO_INVALID_OUTPUT_RATE = 0x1002,
    AUDIO_UNSUPPORTED_RATIO = 0x1003,
    AUDIO_RESAMPLE_FAILED = 0x1004,
    AUDIO_CAPTURE_FAILED = 0x1005,
    AUDIO_XRUN_DETECTED = 0x1006,
    AUDIO_FILE_IO_FAILED = 0x1007,

    // Voice activity (0x2000)
    VAD_INVALID_FRAME_DURATION = 0x2001,
    VAD_INVALID_THRESHOLD = 0x2002,
    VAD_INVALID_PAUSE_THRESHOLD = 0x2003,

    // Correction (0x3000)
    CORRECTION_QUEUE_FULL = 0x3001,
    CORRECTION_TASK_FAILED = 0x3002,
    CORRECTION_INPUT_TOO_LONG = 0x3003,
    CORRECTION_ENGINE_STOPPED = 0x3004,
    CORRECTION_CALLBACK_FAILED = 0x3005,

    // Injection (0x4000)
    INJECTION_CLIPBOARD_READ_FAILED = 0x4001,
    INJECTION_CLIPBOARD_WRITE_FAILED = 0x4002,
    INJECTION_STRATEGY_FAILED = 0x4003,
    INJECTION_STRATEGY_TIMEOUT = 0x4004,
    INJECTION_STRATEGY_UNAVAILABLE = 0x4005,
    INJECTION_ALL_STRATEGIES_FAILED = 0x4006,

    // Validation (0x5000)
    VALIDATION_INVALID_CONFIG = 0x5001,
    VALIDATION_INVALID_RULES = 0x5002,
    VALIDATION_UNKNOWN_STRATEGY = 0x5003,
    VALIDATION_FILE_NOT_FOUND = 0x5004,

    // Recognizer (0x6000)
    RECOGNIZER_FAILED = 0x6001,
    RECOGNIZER_TIMEOUT = 0x6002,

    // Internal (0xF000) - Reserved for fallback
    INTERNAL_UNKNOWN = 0xF001,
};

/**
 * @brief Convert ErrorCode to string representation.
 * @return String name (e.g., "AUDIO_UNSUPPORTED_RATIO"), or "UNKNOWN_ERROR" for unknown codes
 */
const char* errorCodeToString(ErrorCode code);

/**
 * @brief Get the category name for an error code.
 * @return Category name (e.g., "correction"), or "internal" for unknown codes
 */
const char* getErrorCategory(ErrorCode code);

/**
 * @brief Convert ErrorCode to hex string (e.g., "0x4002").
 */
std::string errorCodeToHex(ErrorCode code);

/**
 * @brief Convert string to ErrorCode enum.
 * @return Corresponding ErrorCode, or INTERNAL_UNKNOWN if not found
 */
ErrorCode stringToErrorCode(const std::string& str);

// Category check helpers
constexpr bool isAudioError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x1000;
}
constexpr bool isVadError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x2000;
}
constexpr bool isCorrectionError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x3000;
}
constexpr bool isInjectionError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x4000;
}
constexpr bool isValidationError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x5000;
}
constexpr bool isRecognizerError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x6000;
}
constexpr bool isInternalError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0xF000;
}

/**
 * @brief Check if the pipeline recovers from this error on its own.
 *
 * Configuration-time validation errors and the setup-time audio rate checks indicate a
 * caller bug and are not recoverable. Everything that can happen while running is.
 */
constexpr bool isRecoverable(ErrorCode code) {
    return !isValidationError(code) && !isVadError(code) &&
           code != ErrorCode::AUDIO_INVALID_INPUT_RATE &&
           code != ErrorCode::AUDIO_INVALID_OUTPUT_RATE &&
           code != ErrorCode::AUDIO_UNSUPPORTED_RATIO;
}

/**
 * @brief Raised at construction time for invalid configuration.
 */
class ConfigError : public std::invalid_argument {
   public:
    ConfigError(ErrorCode code, const std::string& message);

    ErrorCode code() const {
        return code_;
    }

   private:
    ErrorCode code_;
};

}  // namespace DictationEngine

#endif  // ERROR_CODES_H

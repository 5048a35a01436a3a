#include "core/error_codes.h"

#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace DictationEngine {

#define DICTATION_ERROR_ENTRY(name) {ErrorCode::name, #name}

// Error code to string mapping
static const std::unordered_map<ErrorCode, const char*> kErrorCodeStrings = {
    DICTATION_ERROR_ENTRY(OK),

    // Audio / Resampler
    DICTATION_ERROR_ENTRY(AUDIO_INVALID_INPUT_RATE),
    DICTATION_ERROR_ENTRY(AUDIO_INVALID_OUTPUT_RATE),
    DICTATION_ERROR_ENTRY(AUDIO_UNSUPPORTED_RATIO),
    DICTATION_ERROR_ENTRY(AUDIO_RESAMPLE_FAILED),
    DICTATION_ERROR_ENTRY(AUDIO_CAPTURE_FAILED),
    DICTATION_ERROR_ENTRY(AUDIO_XRUN_DETECTED),
    DICTATION_ERROR_ENTRY(AUDIO_FILE_IO_FAILED),

    // Voice activity
    DICTATION_ERROR_ENTRY(VAD_INVALID_FRAME_DURATION),
    DICTATION_ERROR_ENTRY(VAD_INVALID_THRESHOLD),
    DICTATION_ERROR_ENTRY(VAD_INVALID_PAUSE_THRESHOLD),

    // Correction
    DICTATION_ERROR_ENTRY(CORRECTION_QUEUE_FULL),
    DICTATION_ERROR_ENTRY(CORRECTION_TASK_FAILED),
    DICTATION_ERROR_ENTRY(CORRECTION_INPUT_TOO_LONG),
    DICTATION_ERROR_ENTRY(CORRECTION_ENGINE_STOPPED),
    DICTATION_ERROR_ENTRY(CORRECTION_CALLBACK_FAILED),

    // Injection
    DICTATION_ERROR_ENTRY(INJECTION_CLIPBOARD_READ_FAILED),
    DICTATION_ERROR_ENTRY(INJECTION_CLIPBOARD_WRITE_FAILED),
    DICTATION_ERROR_ENTRY(INJECTION_STRATEGY_FAILED),
    DICTATION_ERROR_ENTRY(INJECTION_STRATEGY_TIMEOUT),
    DICTATION_ERROR_ENTRY(INJECTION_STRATEGY_UNAVAILABLE),
    DICTATION_ERROR_ENTRY(INJECTION_ALL_STRATEGIES_FAILED),

    // Validation
    DICTATION_ERROR_ENTRY(VALIDATION_INVALID_CONFIG),
    DICTATION_ERROR_ENTRY(VALIDATION_INVALID_RULES),
    DICTATION_ERROR_ENTRY(VALIDATION_UNKNOWN_STRATEGY),
    DICTATION_ERROR_ENTRY(VALIDATION_FILE_NOT_FOUND),

    // Recognizer
    DICTATION_ERROR_ENTRY(RECOGNIZER_FAILED),
    DICTATION_ERROR_ENTRY(RECOGNIZER_TIMEOUT),

    // Internal
    DICTATION_ERROR_ENTRY(INTERNAL_UNKNOWN),
};

#undef DICTATION_ERROR_ENTRY

ConfigError::ConfigError(ErrorCode code, const std::string& message)
    : std::invalid_argument(std::string(errorCodeToString(code)) + ": " + message),
      code_(code) {}

const char* errorCodeToString(ErrorCode code) {
    auto it = kErrorCodeStrings.find(code);
    if (it != kErrorCodeStrings.end()) {
        return it->second;
    }
    return "UNKNOWN_ERROR";
}

const char* getErrorCategory(ErrorCode code) {
    if (code == ErrorCode::OK) {
        return "ok";
    }
    if (isAudioError(code)) {
        return "audio";
    }
    if (isVadError(code)) {
        return "voice_activity";
    }
    if (isCorrectionError(code)) {
        return "correction";
    }
    if (isInjectionError(code)) {
        return "injection";
    }
    if (isValidationError(code)) {
        return "validation";
    }
    if (isRecognizerError(code)) {
        return "recognizer";
    }
    return "internal";
}

std::string errorCodeToHex(ErrorCode code) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setfill('0') << std::setw(4) << static_cast<uint32_t>(code);
    return oss.str();
}

ErrorCode stringToErrorCode(const std::string& str) {
    // Reverse lookup; the table is small enough that a linear scan is fine
    for (const auto& entry : kErrorCodeStrings) {
        if (str == entry.second) {
            return entry.first;
        }
    }
    return ErrorCode::INTERNAL_UNKNOWN;
}

}  // namespace DictationEngine

/**
 * @file test_error_codes.cpp
 * @brief Unit tests for the dictation error taxonomy
 */

#include "core/error_codes.h"

#include <gtest/gtest.h>
#include <string>

using namespace DictationEngine;

// ============================================================
// ErrorCode to String Tests
// ============================================================

TEST(ErrorCodes, ErrorCodeToString) {
    EXPECT_STREQ(errorCodeToString(ErrorCode::OK), "OK");
    EXPECT_STREQ(errorCodeToString(ErrorCode::AUDIO_UNSUPPORTED_RATIO), "AUDIO_UNSUPPORTED_RATIO");
    EXPECT_STREQ(errorCodeToString(ErrorCode::CORRECTION_TASK_FAILED), "CORRECTION_TASK_FAILED");
    EXPECT_STREQ(errorCodeToString(ErrorCode::INJECTION_CLIPBOARD_WRITE_FAILED),
                 "INJECTION_CLIPBOARD_WRITE_FAILED");
    EXPECT_STREQ(errorCodeToString(ErrorCode::VALIDATION_UNKNOWN_STRATEGY),
                 "VALIDATION_UNKNOWN_STRATEGY");
}

TEST(ErrorCodes, UnknownErrorCodeReturnsUnknown) {
    auto unknownCode = static_cast<ErrorCode>(0xFFFF);
    EXPECT_STREQ(errorCodeToString(unknownCode), "UNKNOWN_ERROR");
}

// ============================================================
// Error Category Tests
// ============================================================

TEST(ErrorCodes, GetErrorCategory) {
    EXPECT_STREQ(getErrorCategory(ErrorCode::OK), "ok");
    EXPECT_STREQ(getErrorCategory(ErrorCode::AUDIO_RESAMPLE_FAILED), "audio");
    EXPECT_STREQ(getErrorCategory(ErrorCode::VAD_INVALID_THRESHOLD), "voice_activity");
    EXPECT_STREQ(getErrorCategory(ErrorCode::CORRECTION_QUEUE_FULL), "correction");
    EXPECT_STREQ(getErrorCategory(ErrorCode::INJECTION_STRATEGY_TIMEOUT), "injection");
    EXPECT_STREQ(getErrorCategory(ErrorCode::VALIDATION_INVALID_RULES), "validation");
    EXPECT_STREQ(getErrorCategory(ErrorCode::RECOGNIZER_TIMEOUT), "recognizer");
}

TEST(ErrorCodes, UnknownCategoryReturnsInternal) {
    auto unknownCode = static_cast<ErrorCode>(0xFFFF);
    EXPECT_STREQ(getErrorCategory(unknownCode), "internal");
}

TEST(ErrorCodes, CategoryCheckers) {
    EXPECT_TRUE(isAudioError(ErrorCode::AUDIO_XRUN_DETECTED));
    EXPECT_FALSE(isAudioError(ErrorCode::VAD_INVALID_FRAME_DURATION));

    EXPECT_TRUE(isVadError(ErrorCode::VAD_INVALID_PAUSE_THRESHOLD));
    EXPECT_FALSE(isVadError(ErrorCode::CORRECTION_TASK_FAILED));

    EXPECT_TRUE(isCorrectionError(ErrorCode::CORRECTION_INPUT_TOO_LONG));
    EXPECT_FALSE(isCorrectionError(ErrorCode::INJECTION_STRATEGY_FAILED));

    EXPECT_TRUE(isInjectionError(ErrorCode::INJECTION_ALL_STRATEGIES_FAILED));
    EXPECT_FALSE(isInjectionError(ErrorCode::VALIDATION_INVALID_CONFIG));

    EXPECT_TRUE(isValidationError(ErrorCode::VALIDATION_FILE_NOT_FOUND));
    EXPECT_TRUE(isRecognizerError(ErrorCode::RECOGNIZER_FAILED));
    EXPECT_TRUE(isInternalError(ErrorCode::INTERNAL_UNKNOWN));
}

// ============================================================
// Conversion Tests
// ============================================================

TEST(ErrorCodes, ErrorCodeToHex) {
    EXPECT_EQ(errorCodeToHex(ErrorCode::OK), "0x0000");
    EXPECT_EQ(errorCodeToHex(ErrorCode::INJECTION_CLIPBOARD_WRITE_FAILED), "0x4002");
    EXPECT_EQ(errorCodeToHex(ErrorCode::INTERNAL_UNKNOWN), "0xf001");
}

TEST(ErrorCodes, StringToErrorCode) {
    EXPECT_EQ(stringToErrorCode("CORRECTION_QUEUE_FULL"), ErrorCode::CORRECTION_QUEUE_FULL);
    EXPECT_EQ(stringToErrorCode("RECOGNIZER_TIMEOUT"), ErrorCode::RECOGNIZER_TIMEOUT);
    EXPECT_EQ(stringToErrorCode("NOT_A_CODE"), ErrorCode::INTERNAL_UNKNOWN);
}

TEST(ErrorCodes, RuntimeErrorsAreRecoverable) {
    EXPECT_TRUE(isRecoverable(ErrorCode::AUDIO_RESAMPLE_FAILED));
    EXPECT_TRUE(isRecoverable(ErrorCode::CORRECTION_TASK_FAILED));
    EXPECT_TRUE(isRecoverable(ErrorCode::INJECTION_CLIPBOARD_READ_FAILED));
    EXPECT_TRUE(isRecoverable(ErrorCode::RECOGNIZER_TIMEOUT));
}

TEST(ErrorCodes, SetupErrorsAreNotRecoverable) {
    EXPECT_FALSE(isRecoverable(ErrorCode::VALIDATION_INVALID_CONFIG));
    EXPECT_FALSE(isRecoverable(ErrorCode::VAD_INVALID_THRESHOLD));
    EXPECT_FALSE(isRecoverable(ErrorCode::AUDIO_UNSUPPORTED_RATIO));
}

TEST(ErrorCodes, ConfigErrorCarriesCode) {
    ConfigError error(ErrorCode::VALIDATION_UNKNOWN_STRATEGY, "no such strategy 'foo'");
    EXPECT_EQ(error.code(), ErrorCode::VALIDATION_UNKNOWN_STRATEGY);
    EXPECT_EQ(std::string(error.what()), "VALIDATION_UNKNOWN_STRATEGY: no such strategy 'foo'");
}

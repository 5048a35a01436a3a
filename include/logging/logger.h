/**
 * @file logger.h
 * @brief Structured logging API for the dictation pipeline
 *
 * Provides a unified logging interface using spdlog.
 * Supports console output, rotating file output, and configurable log levels.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

// Forward declare spdlog logger
namespace spdlog {
class logger;
}  // namespace spdlog

namespace dictation {
namespace logging {

/**
 * @brief Log level enumeration
 */
enum class LogLevel : std::uint8_t {
    Trace,     // Very detailed debugging information
    Debug,     // Debug information
    Info,      // General information
    Warn,      // Warnings
    Error,     // Errors
    Critical,  // Critical errors
    Off        // Disable logging
};

/**
 * @brief Logging configuration
 */
struct LogConfig {
    LogLevel level = LogLevel::Info;
    std::string filePath = "";                                  // Empty = no file output
    size_t maxFileSize = static_cast<size_t>(5 * 1024 * 1024);  // 5 MB
    size_t maxBackups = 3;
    bool consoleOutput = true;
    bool coloredOutput = true;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
};

/**
 * @brief Initialize the logging system
 *
 * Calling it again after a successful initialization only updates level and pattern.
 *
 * @param config Logging configuration
 * @return true if initialization succeeded, false otherwise
 */
bool initialize(const LogConfig& config = LogConfig{});

/**
 * @brief Early initialization with stderr output only
 *
 * Lightweight initialization for logging before the config file is read, so that
 * config parse warnings are not lost. Can be followed by initialize() with the
 * loaded configuration.
 *
 * @return true if initialization succeeded, false otherwise
 */
bool initializeEarly();

/**
 * @brief Shutdown the logging system
 *
 * Flushes all pending log messages and releases resources.
 */
void shutdown();

void setLevel(LogLevel level);

LogLevel getLevel();

void flush();

/**
 * @brief Get the underlying spdlog logger
 *
 * Initializes with defaults on first use.
 */
std::shared_ptr<spdlog::logger> getLogger();

std::string_view levelToString(LogLevel level);

/**
 * @brief Convert string to LogLevel
 *
 * @param str Level name (case-insensitive)
 * @return Corresponding LogLevel, defaults to Info if unknown
 */
LogLevel stringToLevel(std::string_view str);

/**
 * @brief Check whether a level name is one stringToLevel() understands
 */
bool isKnownLevel(std::string_view str);

}  // namespace logging
}  // namespace dictation

// Include spdlog for macro usage
#include <spdlog/spdlog.h>

#define LOG_TRACE(...)                                 \
    do {                                               \
        auto logger = dictation::logging::getLogger(); \
        if (logger)                                    \
            SPDLOG_LOGGER_TRACE(logger, __VA_ARGS__);  \
    } while (0)

#define LOG_DEBUG(...)                                 \
    do {                                               \
        auto logger = dictation::logging::getLogger(); \
        if (logger)                                    \
            SPDLOG_LOGGER_DEBUG(logger, __VA_ARGS__);  \
    } while (0)

#define LOG_INFO(...)                                  \
    do {                                               \
        auto logger = dictation::logging::getLogger(); \
        if (logger)                                    \
            SPDLOG_LOGGER_INFO(logger, __VA_ARGS__);   \
    } while (0)

#define LOG_WARN(...)                                  \
    do {                                               \
        auto logger = dictation::logging::getLogger(); \
        if (logger)                                    \
            SPDLOG_LOGGER_WARN(logger, __VA_ARGS__);   \
    } while (0)

#define LOG_ERROR(...)                                 \
    do {                                               \
        auto logger = dictation::logging::getLogger(); \
        if (logger)                                    \
            SPDLOG_LOGGER_ERROR(logger, __VA_ARGS__);  \
    } while (0)

#define LOG_CRITICAL(...)                               \
    do {                                                \
        auto logger = dictation::logging::getLogger();  \
        if (logger)                                     \
            SPDLOG_LOGGER_CRITICAL(logger, __VA_ARGS__); \
    } while (0)

// ============================================================
// Conditional logging macros (for per-frame paths)
// ============================================================

#define LOG_IF(level, condition, ...) \
    do {                              \
        if (condition)                \
            LOG_##level(__VA_ARGS__); \
    } while (0)

/**
 * @brief Log every N occurrences
 *
 * Rate-limits logs emitted from the audio callback.
 */
#define LOG_EVERY_N(level, n, ...)                            \
    do {                                                      \
        static std::atomic<uint64_t> log_count_##__LINE__{0}; \
        if (log_count_##__LINE__.fetch_add(1) % (n) == 0) {   \
            LOG_##level(__VA_ARGS__);                         \
        }                                                     \
    } while (0)

#define LOG_ONCE(level, ...)                                             \
    do {                                                                 \
        static std::atomic<bool> logged_##__LINE__{false};               \
        bool expected = false;                                           \
        if (logged_##__LINE__.compare_exchange_strong(expected, true)) { \
            LOG_##level(__VA_ARGS__);                                    \
        }                                                                \
    } while (0)

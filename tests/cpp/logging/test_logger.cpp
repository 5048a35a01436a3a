#include "logging/logger.h"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <unistd.h>

using namespace dictation::logging;

TEST(Logging, ParsesLevelNames) {
    EXPECT_EQ(stringToLevel("info"), LogLevel::Info);
    EXPECT_EQ(stringToLevel("INFO"), LogLevel::Info);
    EXPECT_EQ(stringToLevel("warning"), LogLevel::Warn);
    EXPECT_EQ(stringToLevel("ERR"), LogLevel::Error);
    EXPECT_EQ(stringToLevel("fatal"), LogLevel::Critical);
    EXPECT_EQ(stringToLevel("none"), LogLevel::Off);
    EXPECT_EQ(stringToLevel("unknown"), LogLevel::Info);
}

TEST(Logging, KnownLevelNames) {
    EXPECT_TRUE(isKnownLevel("trace"));
    EXPECT_TRUE(isKnownLevel("Debug"));
    EXPECT_FALSE(isKnownLevel("verbose"));
    EXPECT_FALSE(isKnownLevel(""));
}

TEST(Logging, LevelNamesRoundTrip) {
    for (auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warn,
                       LogLevel::Error, LogLevel::Critical, LogLevel::Off}) {
        EXPECT_EQ(stringToLevel(levelToString(level)), level);
    }
}

TEST(Logging, HonorsConfiguredLevel) {
    ASSERT_TRUE(initialize());
    setLevel(LogLevel::Warn);
    EXPECT_EQ(getLevel(), LogLevel::Warn);

    setLevel(LogLevel::Debug);
    EXPECT_EQ(getLevel(), LogLevel::Debug);

    setLevel(LogLevel::Info);  // reset for other tests
}

TEST(Logging, LoggerInitializesLazily) {
    shutdown();
    EXPECT_NE(getLogger(), nullptr);
    LOG_INFO("lazy logger {}", 1);
}

TEST(Logging, WritesToRotatingFile) {
    const auto path = std::filesystem::temp_directory_path() /
                      ("dictation_log_test_" + std::to_string(getpid()) + ".log");
    std::filesystem::remove(path);

    shutdown();
    LogConfig config;
    config.consoleOutput = false;
    config.filePath = path.string();
    ASSERT_TRUE(initialize(config));

    LOG_WARN("clipboard write failed: {}", "xclip");
    flush();
    shutdown();

    std::ifstream file(path);
    std::stringstream contents;
    contents << file.rdbuf();
    EXPECT_NE(contents.str().find("clipboard write failed: xclip"), std::string::npos);
    std::filesystem::remove(path);
}

TEST(Logging, RateLimitedMacrosThrottleRepeats) {
    const auto path = std::filesystem::temp_directory_path() /
                      ("dictation_log_rate_" + std::to_string(getpid()) + ".log");
    std::filesystem::remove(path);

    shutdown();
    LogConfig config;
    config.consoleOutput = false;
    config.filePath = path.string();
    ASSERT_TRUE(initialize(config));

    for (int i = 0; i < 250; ++i) {
        LOG_EVERY_N(WARN, 100, "decimation fallback #{}", i);
        LOG_ONCE(WARN, "read called before open");
    }
    LOG_CRITICAL("invalid configuration: {}", "rate");
    flush();
    shutdown();

    std::ifstream file(path);
    std::stringstream contents;
    contents << file.rdbuf();
    const std::string text = contents.str();

    auto countOf = [&text](const std::string& needle) {
        int n = 0;
        for (size_t pos = text.find(needle); pos != std::string::npos;
             pos = text.find(needle, pos + needle.size())) {
            ++n;
        }
        return n;
    };
    EXPECT_EQ(countOf("decimation fallback #"), 3);
    EXPECT_NE(text.find("decimation fallback #0"), std::string::npos);
    EXPECT_NE(text.find("decimation fallback #200"), std::string::npos);
    EXPECT_EQ(countOf("read called before open"), 1);
    EXPECT_NE(text.find("invalid configuration: rate"), std::string::npos);
    std::filesystem::remove(path);
}

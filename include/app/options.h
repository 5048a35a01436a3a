#pragma once

#include "core/config_loader.h"

#include <cstdlib>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

// Command-line options. Unset optionals leave the config file value in place.
struct Options {
    std::string configPath{DEFAULT_CONFIG_FILE};
    std::optional<std::string> inputPath;  // WAV replay instead of live capture
    std::optional<std::string> device;
    std::optional<std::string> recognizerCommand;
    std::optional<std::string> logLevel;
    std::optional<std::string> correctText;  // One-shot correction, no audio
    bool printOnly{false};
};

struct ParseOptionsResult {
    std::optional<Options> options;
    bool showHelp{false};
    bool showVersion{false};
    bool hasError{false};
    std::string errorMessage;
};

ParseOptionsResult parseOptions(
    int argc, char **argv, std::string_view programName,
    const std::function<const char *(const char *)> &getenvFn = ::getenv);

// Overlay CLI and environment values onto the loaded configuration
void applyOptions(const Options &options, AppConfig &config);

void printHelp(std::string_view programName);
void printVersion(std::string_view programName);

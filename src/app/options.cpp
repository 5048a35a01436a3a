#include "app/options.h"

#include "logging/logger.h"

#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

namespace {

constexpr const char *kVersion = "0.1.0";

bool applyEnvOverrides(Options &opt, ParseOptionsResult &result,
                       const std::function<const char *(const char *)> &getenvFn) {
    auto fail = [&](const std::string &message) {
        result.hasError = true;
        result.errorMessage = message;
        return false;
    };

    if (const char *device = getenvFn("DICTATION_DEVICE")) {
        opt.device = std::string{device};
    }
    if (const char *command = getenvFn("DICTATION_RECOGNIZER_CMD")) {
        opt.recognizerCommand = std::string{command};
    }
    if (const char *logLevel = getenvFn("DICTATION_LOG_LEVEL")) {
        if (!dictation::logging::isKnownLevel(logLevel)) {
            return fail(
                "Unsupported DICTATION_LOG_LEVEL. Use one of: "
                "trace|debug|info|warn|error|critical|off");
        }
        opt.logLevel = std::string{logLevel};
    }
    return true;
}

}  // namespace

void printHelp(std::string_view programName) {
    std::cout << "Usage: " << programName
              << " [--config config.json] [--input speech.wav | --device default]"
              << " [--recognizer-cmd \"whisper-cli -f {wav}\"] [--print-only]"
              << " [--correct \"text\"] [--log-level info] [--help] [--version]" << std::endl
              << std::endl
              << "Dictation options:" << std::endl
              << "  -c, --config          JSON configuration file (default: config.json)"
              << std::endl
              << "  -i, --input           Replay a WAV file instead of live capture" << std::endl
              << "  -d, --device          ALSA capture device (e.g., default, hw:1,0)"
              << std::endl
              << "  -r, --recognizer-cmd  Speech recognizer command; {wav} is replaced by the"
              << " segment file" << std::endl
              << "  -p, --print-only      Print corrected text to stdout instead of pasting"
              << std::endl
              << "  --correct             Correct the given text, print it and exit" << std::endl
              << "  --log-level           Log level: trace | debug | info | warn | error" << std::endl
              << "  -h, --help            Show this help and exit" << std::endl
              << "  -V, --version         Show version and exit" << std::endl
              << std::endl
              << "Environment overrides: DICTATION_DEVICE, DICTATION_RECOGNIZER_CMD, "
                 "DICTATION_LOG_LEVEL"
              << std::endl;
}

void printVersion(std::string_view programName) {
    std::cout << programName << " version " << kVersion << std::endl;
}

ParseOptionsResult parseOptions(int argc, char **argv, std::string_view programName,
                                const std::function<const char *(const char *)> &getenvFn) {
    Options opt{};
    ParseOptionsResult result{};

    if (!applyEnvOverrides(opt, result, getenvFn)) {
        return result;
    }

    auto missingValue = [&](std::string_view arg) {
        result.hasError = true;
        result.errorMessage = std::string("Missing value for ") + std::string(arg);
        return result;
    };

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg{argv[i]};
        const bool hasValue = i + 1 < argc;
        if (arg == "-h" || arg == "--help") {
            printHelp(programName);
            result.showHelp = true;
            return result;
        } else if (arg == "-V" || arg == "--version") {
            printVersion(programName);
            result.showVersion = true;
            return result;
        } else if (arg == "-p" || arg == "--print-only") {
            opt.printOnly = true;
        } else if (arg == "-c" || arg == "--config") {
            if (!hasValue) {
                return missingValue(arg);
            }
            opt.configPath = argv[++i];
        } else if (arg == "-i" || arg == "--input") {
            if (!hasValue) {
                return missingValue(arg);
            }
            opt.inputPath = std::string{argv[++i]};
        } else if (arg == "-d" || arg == "--device") {
            if (!hasValue) {
                return missingValue(arg);
            }
            opt.device = std::string{argv[++i]};
        } else if (arg == "-r" || arg == "--recognizer-cmd") {
            if (!hasValue) {
                return missingValue(arg);
            }
            opt.recognizerCommand = std::string{argv[++i]};
        } else if (arg == "--correct") {
            if (!hasValue) {
                return missingValue(arg);
            }
            opt.correctText = std::string{argv[++i]};
        } else if (arg == "--log-level") {
            if (!hasValue) {
                return missingValue(arg);
            }
            const std::string level{argv[++i]};
            if (!dictation::logging::isKnownLevel(level)) {
                result.hasError = true;
                result.errorMessage =
                    "Unsupported log level. Use one of: trace|debug|info|warn|error|critical|off";
                return result;
            }
            opt.logLevel = level;
        } else {
            result.hasError = true;
            result.errorMessage = std::string("Unknown argument: ") + std::string(arg);
            return result;
        }
    }

    if (opt.inputPath && opt.correctText) {
        result.hasError = true;
        result.errorMessage = "--input and --correct cannot be combined";
        return result;
    }

    result.options = opt;
    return result;
}

void applyOptions(const Options &options, AppConfig &config) {
    if (options.device) {
        config.capture.device = *options.device;
    }
    if (options.recognizerCommand) {
        config.recognizer.command = *options.recognizerCommand;
    }
    if (options.logLevel) {
        config.logging.level = *options.logLevel;
    }
}

#include "app/options.h"
#include "audio/alsa_capture.h"
#include "audio/audio_io.h"
#include "core/config_loader.h"
#include "core/error_codes.h"
#include "core/process_runner.h"
#include "correction/correction_engine.h"
#include "injection/clipboard.h"
#include "injection/injection_manager.h"
#include "injection/paste_strategy.h"
#include "logging/logger.h"
#include "pipeline/dictation_pipeline.h"
#include "pipeline/external_recognizer.h"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace {

std::atomic<bool> gStopRequested{false};

void handleSignal(int /*signum*/) {
    gStopRequested.store(true);
}

void installSignalHandlers() {
    struct sigaction sa {};
    sa.sa_handler = handleSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

std::optional<AudioCapture::AlsaCapture::SampleFormat> captureFormat(const std::string& name) {
    return AudioCapture::AlsaCapture::parseFormat(name);
}

TextInjection::PlatformFamily resolvePlatform(const std::string& configured) {
    if (auto parsed = TextInjection::parsePlatformFamily(configured)) {
        return *parsed;
    }
    return TextInjection::detectPlatformFamily(::getenv);
}

std::unique_ptr<TextInjection::Manager> buildInjectionManager(
    const AppConfig& config, const std::shared_ptr<Process::CommandRunner>& runner) {
    const auto family = resolvePlatform(config.injection.platform);
    LOG_INFO("Injection platform: {}", TextInjection::platformFamilyToString(family));

    std::vector<TextInjection::PasteCommand> strategies =
        config.injection.strategies.empty()
            ? TextInjection::defaultPasteStrategies(family)
            : TextInjection::resolvePasteStrategies(config.injection.strategies);

    auto clipboard = std::make_shared<TextInjection::CommandClipboard>(
        TextInjection::defaultClipboardCommands(family), runner,
        std::chrono::milliseconds(DictationConstants::CLIPBOARD_COMMAND_TIMEOUT_MS));

    return std::make_unique<TextInjection::Manager>(config.injection.timing, clipboard,
                                                    std::move(strategies), runner);
}

Pipeline::PipelineConfig buildPipelineConfig(const AppConfig& config, int inputRate,
                                             int channels) {
    Pipeline::PipelineConfig pipelineConfig;
    pipelineConfig.captureChannels = channels;
    pipelineConfig.resampler = config.resampler;
    if (pipelineConfig.resampler.inputRate == 0) {
        pipelineConfig.resampler.inputRate = inputRate;
    } else if (pipelineConfig.resampler.inputRate != inputRate) {
        LOG_WARN("resampler.inputRate {} differs from input rate {}, using {}",
                 pipelineConfig.resampler.inputRate, inputRate, inputRate);
        pipelineConfig.resampler.inputRate = inputRate;
    }
    pipelineConfig.vad = config.vad;
    pipelineConfig.maxSegmentMs = config.maxSegmentMs;
    pipelineConfig.recognizerQueueCapacity = config.recognizer.queueCapacity;
    return pipelineConfig;
}

bool replayFile(const std::string& path, const AppConfig& config,
                const std::shared_ptr<Pipeline::Recognizer>& recognizer,
                const std::shared_ptr<Correction::Engine>& correction,
                const Pipeline::TextSink& sink) {
    AudioIO::WavReader reader;
    if (!reader.open(path)) {
        return false;
    }

    Pipeline::DictationPipeline pipeline(
        buildPipelineConfig(config, reader.getSampleRate(), reader.getChannels()), recognizer,
        correction, sink);
    if (!pipeline.start()) {
        return false;
    }

    const sf_count_t blockFrames = config.capture.periodFrames;
    std::vector<float> block(static_cast<size_t>(blockFrames) *
                             static_cast<size_t>(reader.getChannels()));
    while (!gStopRequested.load()) {
        sf_count_t frames = reader.readBlock(block.data(), blockFrames);
        if (frames <= 0) {
            break;
        }
        pipeline.pushAudio(block.data(), static_cast<size_t>(frames));
    }

    pipeline.finishInput();
    pipeline.stop();

    auto stats = pipeline.getStats();
    LOG_INFO("Replay finished: frames={} segments={} transcripts={} failures={}",
             stats.framesProcessed, stats.segmentsEmitted, stats.transcriptsSubmitted,
             stats.recognitionFailures);
    return true;
}

bool openCaptureWithRetry(AudioCapture::AlsaCapture& capture,
                          AudioCapture::AlsaCapture::Config& cfg) {
    std::chrono::milliseconds backoff{1000};
    const std::chrono::milliseconds backoffMax{8000};
    while (!gStopRequested.load()) {
        if (capture.open(cfg) && capture.start()) {
            cfg = capture.activeConfig();
            if (auto currentRate = capture.currentSampleRate()) {
                cfg.sampleRate = *currentRate;
            }
            return true;
        }
        LOG_WARN("Failed to open/start capture device {}, retrying in {} ms", cfg.deviceName,
                 backoff.count());
        capture.close();
        std::this_thread::sleep_for(backoff);
        backoff = std::min(backoff * 2, backoffMax);
    }
    return false;
}

bool runLiveCapture(const AppConfig& config,
                    const std::shared_ptr<Pipeline::Recognizer>& recognizer,
                    const std::shared_ptr<Correction::Engine>& correction,
                    const Pipeline::TextSink& sink) {
    AudioCapture::AlsaCapture capture;
    AudioCapture::AlsaCapture::Config cfg;
    cfg.deviceName = config.capture.device;
    cfg.sampleRate = static_cast<unsigned int>(config.capture.sampleRate);
    cfg.channels = static_cast<unsigned int>(config.capture.channels);
    cfg.periodFrames = static_cast<snd_pcm_uframes_t>(config.capture.periodFrames);
    if (auto format = captureFormat(config.capture.format)) {
        cfg.format = *format;
    }

    if (!openCaptureWithRetry(capture, cfg)) {
        return false;
    }

    Pipeline::DictationPipeline pipeline(
        buildPipelineConfig(config, static_cast<int>(cfg.sampleRate),
                            static_cast<int>(cfg.channels)),
        recognizer, correction, sink);
    if (!pipeline.start()) {
        capture.stop();
        capture.close();
        return false;
    }
    LOG_INFO("Listening on {} ({} Hz, {} ch). Press Ctrl+C to stop.", cfg.deviceName,
             cfg.sampleRate, cfg.channels);

    std::vector<float> interleaved;
    bool ok = true;
    while (!gStopRequested.load()) {
        int frames = capture.readFloat(interleaved);
        if (frames == -EPIPE) {
            continue;
        }
        if (frames < 0) {
            LOG_ERROR("Capture failed ({}), stopping",
                      DictationEngine::errorCodeToString(
                          DictationEngine::ErrorCode::AUDIO_CAPTURE_FAILED));
            ok = false;
            break;
        }
        if (frames == 0) {
            continue;
        }
        pipeline.pushAudio(interleaved.data(), static_cast<size_t>(frames));
    }

    capture.stop();
    capture.close();
    pipeline.finishInput();
    pipeline.stop();
    return ok;
}

}  // namespace

int main(int argc, char** argv) {
    const std::string_view programName =
        (argc > 0 && argv[0] != nullptr) ? std::string_view{argv[0]} : "dictation";

    dictation::logging::initializeEarly();

    auto parsed = parseOptions(argc, argv, programName);
    if (parsed.showHelp || parsed.showVersion) {
        return EXIT_SUCCESS;
    }
    if (parsed.hasError || !parsed.options) {
        LOG_ERROR("{}", parsed.errorMessage);
        return EXIT_FAILURE;
    }
    const Options opt = *parsed.options;

    AppConfig config;
    loadAppConfig(opt.configPath, config);
    applyOptions(opt, config);
    dictation::logging::initialize(toLogConfig(config.logging));

    int exitCode = EXIT_SUCCESS;
    try {
        auto correction = std::make_shared<Correction::Engine>(config.correction);

        if (opt.correctText) {
            auto result = correction->correct(*opt.correctText);
            std::cout << result.correctedText << std::endl;
            for (const auto& change : result.corrections) {
                LOG_INFO("  {} -> {}", change.first, change.second);
            }
            dictation::logging::shutdown();
            return result.ok() ? EXIT_SUCCESS : EXIT_FAILURE;
        }

        if (config.recognizer.command.empty()) {
            LOG_ERROR("No recognizer command configured (use --recognizer-cmd or "
                      "recognizer.command)");
            dictation::logging::shutdown();
            return EXIT_FAILURE;
        }

        installSignalHandlers();

        auto runner = std::make_shared<Process::PosixCommandRunner>();

        Pipeline::ExternalRecognizerConfig recognizerConfig;
        recognizerConfig.command = config.recognizer.command;
        recognizerConfig.timeoutMs = config.recognizer.timeoutMs;
        auto recognizer =
            std::make_shared<Pipeline::ExternalCommandRecognizer>(recognizerConfig, runner);

        std::unique_ptr<TextInjection::Manager> injector;
        Pipeline::TextSink sink;
        if (opt.printOnly) {
            sink = [](const Correction::CorrectionResult& result) {
                std::cout << result.correctedText << std::endl;
            };
        } else {
            injector = buildInjectionManager(config, runner);
            TextInjection::Manager* manager = injector.get();
            sink = [manager](const Correction::CorrectionResult& result) {
                auto report = manager->inject(result.correctedText);
                if (!report.delivered() &&
                    report.outcome != TextInjection::InjectionOutcome::Skipped) {
                    LOG_ERROR("Injection failed ({}): {}",
                              DictationEngine::errorCodeToString(report.error),
                              result.correctedText);
                }
            };
        }

        bool ok = opt.inputPath ? replayFile(*opt.inputPath, config, recognizer, correction, sink)
                                : runLiveCapture(config, recognizer, correction, sink);
        if (!ok) {
            exitCode = EXIT_FAILURE;
        }

        correction->shutdown();
        if (injector) {
            injector->shutdown();
            auto stats = injector->getStats();
            LOG_INFO("Injection stats: pasted={} clipboard_only={} failed={} skipped={}",
                     stats.pasted, stats.clipboardOnly, stats.failed, stats.skipped);
        }
        auto correctionStats = correction->getStats();
        LOG_INFO("Correction stats: processed={} failed={} avg={:.2f}ms over_budget={}",
                 correctionStats.processed, correctionStats.failed,
                 correctionStats.averageProcessingMs(), correctionStats.overBudget);
    } catch (const DictationEngine::ConfigError& e) {
        LOG_CRITICAL("Invalid configuration: {}", e.what());
        exitCode = EXIT_FAILURE;
    }

    dictation::logging::shutdown();
    return exitCode;
}

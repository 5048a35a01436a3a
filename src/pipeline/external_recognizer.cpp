#include "pipeline/external_recognizer.h"

#include "audio/audio_io.h"
#include "core/error_codes.h"
#include "logging/logger.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <unistd.h>
#include <utility>

namespace Pipeline {

namespace {

constexpr const char* kWavPlaceholder = "{wav}";

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    const size_t begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    const size_t end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

// Removes the file on scope exit
class TempFileGuard {
   public:
    explicit TempFileGuard(std::string path) : path_(std::move(path)) {}
    ~TempFileGuard() {
        if (!path_.empty()) {
            ::unlink(path_.c_str());
        }
    }
    TempFileGuard(const TempFileGuard&) = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;

   private:
    std::string path_;
};

}  // namespace

ExternalCommandRecognizer::ExternalCommandRecognizer(
    const ExternalRecognizerConfig& config, std::shared_ptr<Process::CommandRunner> runner)
    : config_(config), runner_(std::move(runner)) {
    argvTemplate_ = Process::splitCommandLine(config_.command);
    if (argvTemplate_.empty()) {
        throw DictationEngine::ConfigError(DictationEngine::ErrorCode::VALIDATION_INVALID_CONFIG,
                                           "recognizer command is empty");
    }
    if (config_.timeoutMs <= 0) {
        throw DictationEngine::ConfigError(DictationEngine::ErrorCode::VALIDATION_INVALID_CONFIG,
                                           "recognizer timeout must be positive");
    }
}

std::string ExternalCommandRecognizer::name() const {
    return argvTemplate_.front();
}

std::vector<std::string> ExternalCommandRecognizer::buildArgv(const std::string& wavPath) const {
    std::vector<std::string> argv;
    argv.reserve(argvTemplate_.size() + 1);
    bool substituted = false;
    for (const auto& arg : argvTemplate_) {
        std::string expanded = arg;
        size_t pos = expanded.find(kWavPlaceholder);
        while (pos != std::string::npos) {
            expanded.replace(pos, std::strlen(kWavPlaceholder), wavPath);
            substituted = true;
            pos = expanded.find(kWavPlaceholder, pos + wavPath.size());
        }
        argv.push_back(std::move(expanded));
    }
    if (!substituted) {
        argv.push_back(wavPath);
    }
    return argv;
}

std::string ExternalCommandRecognizer::makeTempPath() const {
    std::string dir = config_.tempDir;
    if (dir.empty()) {
        const char* tmp = std::getenv("TMPDIR");
        dir = (tmp && tmp[0] != '\0') ? tmp : "/tmp";
    }
    std::string pattern = dir + "/dictation-segment-XXXXXX.wav";
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    const int fd = ::mkstemps(buffer.data(), 4);
    if (fd < 0) {
        LOG_ERROR("Recognizer: cannot create temp file in {}: {}", dir, std::strerror(errno));
        return "";
    }
    ::close(fd);
    return std::string(buffer.data());
}

std::optional<std::string> ExternalCommandRecognizer::transcribe(
    const VoiceActivity::Segment& segment) {
    if (segment.samples.empty()) {
        return std::string();
    }

    const std::string wavPath = makeTempPath();
    if (wavPath.empty()) {
        return std::nullopt;
    }
    TempFileGuard guard(wavPath);

    if (!AudioIO::writeMonoWav(wavPath, segment.samples, segment.sampleRate)) {
        LOG_ERROR("Recognizer: failed to write segment #{} to {}", segment.sequence, wavPath);
        return std::nullopt;
    }

    Process::CommandRequest request;
    request.argv = buildArgv(wavPath);
    request.timeout = std::chrono::milliseconds(config_.timeoutMs);

    LOG_DEBUG("Recognizer: segment #{} ({:.2f} s) -> {}", segment.sequence,
              segment.durationSeconds(), Process::toCommandString(request.argv));
    const Process::CommandResult result = runner_->run(request);

    if (!result.ok()) {
        LOG_ERROR("Recognizer: '{}' {} (exit {}){}{}", argvTemplate_.front(),
                  Process::statusToString(result.status), result.exitCode,
                  result.errorOutput.empty() ? "" : ": ", trim(result.errorOutput));
        return std::nullopt;
    }
    return trim(result.output);
}

}  // namespace Pipeline

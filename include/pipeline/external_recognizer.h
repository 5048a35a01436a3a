#ifndef EXTERNAL_RECOGNIZER_H
#define EXTERNAL_RECOGNIZER_H

#include "core/dictation_constants.h"
#include "core/process_runner.h"
#include "pipeline/recognizer.h"

#include <memory>
#include <string>
#include <vector>

namespace Pipeline {

struct ExternalRecognizerConfig {
    // Command line; "{wav}" is replaced with the segment file path, which is appended as
    // the last argument when no placeholder is present
    std::string command;
    int timeoutMs = DictationConstants::DEFAULT_RECOGNIZER_TIMEOUT_MS;
    std::string tempDir;  // Empty: $TMPDIR, then /tmp
};

// Runs an external speech-to-text program on each segment, written as a 16-bit WAV file,
// and takes its trimmed stdout as the transcript.
class ExternalCommandRecognizer : public Recognizer {
   public:
    // Throws DictationEngine::ConfigError when the command is empty
    ExternalCommandRecognizer(const ExternalRecognizerConfig& config,
                              std::shared_ptr<Process::CommandRunner> runner);

    std::optional<std::string> transcribe(const VoiceActivity::Segment& segment) override;

    std::string name() const override;

    // Argument list for a given WAV path
    std::vector<std::string> buildArgv(const std::string& wavPath) const;

   private:
    std::string makeTempPath() const;

    ExternalRecognizerConfig config_;
    std::vector<std::string> argvTemplate_;
    std::shared_ptr<Process::CommandRunner> runner_;
};

}  // namespace Pipeline

#endif  // EXTERNAL_RECOGNIZER_H

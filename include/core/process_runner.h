#ifndef PROCESS_RUNNER_H
#define PROCESS_RUNNER_H

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace Process {

struct CommandResult {
    enum class Status {
        Ok,          // Exited with status 0
        NotFound,    // Executable not on PATH
        Failed,      // Non-zero exit or killed by a signal
        TimedOut,    // Killed after the deadline
        SpawnError,  // pipe/spawn failure other than a missing executable
    };

    Status status = Status::SpawnError;
    int exitCode = -1;
    std::string output;       // stdout
    std::string errorOutput;  // stderr

    bool ok() const {
        return status == Status::Ok;
    }
};

const char* statusToString(CommandResult::Status status);

struct CommandRequest {
    std::vector<std::string> argv;
    std::optional<std::string> input;  // Written to stdin, then stdin is closed
    std::chrono::milliseconds timeout{1000};
    // Clipboard owners (xclip, wl-copy) fork a server that inherits stdout; send output
    // to /dev/null for those or the read side never sees EOF.
    bool captureOutput = true;
};

// Runs external helper programs (clipboard tools, key injectors, recognizers).
// Implementations must not throw; every failure is reported through CommandResult.
class CommandRunner {
   public:
    virtual ~CommandRunner() = default;

    virtual CommandResult run(const CommandRequest& request) = 0;
};

// posix_spawnp-based runner. stdin/stdout/stderr are pipes; the child is killed with
// SIGKILL when the timeout expires.
class PosixCommandRunner : public CommandRunner {
   public:
    explicit PosixCommandRunner(size_t maxOutputBytes = 16 * 1024 * 1024);

    CommandResult run(const CommandRequest& request) override;

   private:
    size_t maxOutputBytes_;
};

// Shell-style quoting for log messages
std::string toCommandString(const std::vector<std::string>& argv);

// Split a configured command line into argv. Whitespace separates words; single and
// double quotes group, backslash escapes the next character. No expansion is performed.
std::vector<std::string> splitCommandLine(const std::string& commandLine);

}  // namespace Process

#endif  // PROCESS_RUNNER_H

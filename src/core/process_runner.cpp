#include "core/process_runner.h"

#include "logging/logger.h"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace Process {

namespace {

using SteadyClock = std::chrono::steady_clock;

// Closes the descriptor on scope exit
class FdGuard {
   public:
    FdGuard() = default;
    explicit FdGuard(int fd) : fd_(fd) {}
    ~FdGuard() {
        reset();
    }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const {
        return fd_;
    }
    void reset(int fd = -1) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

   private:
    int fd_ = -1;
};

struct Pipe {
    FdGuard read;
    FdGuard write;

    bool open() {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            return false;
        }
        read.reset(fds[0]);
        write.reset(fds[1]);
        return true;
    }
};

void ignoreSigpipeOnce() {
    // A helper that exits without reading its stdin must not kill the whole process
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

void setNonBlocking(int fd) {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

int remainingMs(SteadyClock::time_point deadline) {
    const auto left =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - SteadyClock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

// Reads what is available; returns false on EOF or error
bool drainFd(int fd, std::string& sink, size_t limit) {
    char buf[4096];
    for (;;) {
        const ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            const size_t room = sink.size() < limit ? limit - sink.size() : 0;
            sink.append(buf, std::min(static_cast<size_t>(n), room));
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

void killAndReap(pid_t pid) {
    int status = 0;
    ::kill(pid, SIGKILL);
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

}  // namespace

const char* statusToString(CommandResult::Status status) {
    switch (status) {
    case CommandResult::Status::Ok:
        return "ok";
    case CommandResult::Status::NotFound:
        return "not_found";
    case CommandResult::Status::Failed:
        return "failed";
    case CommandResult::Status::TimedOut:
        return "timed_out";
    case CommandResult::Status::SpawnError:
        return "spawn_error";
    }
    return "unknown";
}

std::string toCommandString(const std::vector<std::string>& argv) {
    std::string out;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) {
            out += ' ';
        }
        const std::string& arg = argv[i];
        if (!arg.empty() && arg.find_first_of(" \t\"'\\$") == std::string::npos) {
            out += arg;
            continue;
        }
        out += '\'';
        for (char c : arg) {
            if (c == '\'') {
                out += "'\\''";
            } else {
                out += c;
            }
        }
        out += '\'';
    }
    return out;
}

std::vector<std::string> splitCommandLine(const std::string& commandLine) {
    std::vector<std::string> words;
    std::string current;
    bool inWord = false;
    char quote = '\0';

    for (size_t i = 0; i < commandLine.size(); ++i) {
        const char c = commandLine[i];
        if (quote != '\0') {
            if (c == quote) {
                quote = '\0';
            } else if (c == '\\' && quote == '"' && i + 1 < commandLine.size()) {
                current += commandLine[++i];
            } else {
                current += c;
            }
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
            inWord = true;
        } else if (c == '\\' && i + 1 < commandLine.size()) {
            current += commandLine[++i];
            inWord = true;
        } else if (c == ' ' || c == '\t' || c == '\n') {
            if (inWord) {
                words.push_back(std::move(current));
                current.clear();
                inWord = false;
            }
        } else {
            current += c;
            inWord = true;
        }
    }
    if (inWord) {
        words.push_back(std::move(current));
    }
    return words;
}

PosixCommandRunner::PosixCommandRunner(size_t maxOutputBytes) : maxOutputBytes_(maxOutputBytes) {
    ignoreSigpipeOnce();
}

CommandResult PosixCommandRunner::run(const CommandRequest& request) {
    const std::vector<std::string>& argv = request.argv;
    const std::optional<std::string>& input = request.input;
    const std::chrono::milliseconds timeout = request.timeout;

    CommandResult result;
    if (argv.empty() || argv[0].empty()) {
        LOG_ERROR("Process: empty command line");
        return result;
    }

    Pipe in;
    Pipe out;
    Pipe err;
    if (!in.open() || (request.captureOutput && (!out.open() || !err.open()))) {
        LOG_ERROR("Process: pipe() failed: {}", std::strerror(errno));
        return result;
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, in.read.get(), STDIN_FILENO);
    if (request.captureOutput) {
        posix_spawn_file_actions_adddup2(&actions, out.write.get(), STDOUT_FILENO);
        posix_spawn_file_actions_adddup2(&actions, err.write.get(), STDERR_FILENO);
    } else {
        posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
        posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = -1;
    const int rc = posix_spawnp(&pid, args[0], &actions, nullptr, args.data(), environ);
    posix_spawn_file_actions_destroy(&actions);

    if (rc != 0) {
        if (rc == ENOENT) {
            result.status = CommandResult::Status::NotFound;
            LOG_DEBUG("Process: '{}' not found", argv[0]);
        } else {
            LOG_ERROR("Process: failed to spawn '{}': {} ({})", argv[0], rc, std::strerror(rc));
        }
        return result;
    }

    // Parent keeps only its own ends
    in.read.reset();
    out.write.reset();
    err.write.reset();
    if (!input || input->empty()) {
        in.write.reset();
    } else {
        setNonBlocking(in.write.get());
    }
    if (request.captureOutput) {
        setNonBlocking(out.read.get());
        setNonBlocking(err.read.get());
    }

    const auto deadline = SteadyClock::now() + timeout;
    size_t written = 0;
    bool outOpen = request.captureOutput;
    bool errOpen = request.captureOutput;
    bool timedOut = false;

    while (outOpen || errOpen || in.write.get() >= 0) {
        const int waitMs = remainingMs(deadline);
        if (waitMs <= 0) {
            timedOut = true;
            break;
        }

        pollfd fds[3];
        nfds_t count = 0;
        int outIdx = -1;
        int errIdx = -1;
        int inIdx = -1;
        if (outOpen) {
            outIdx = static_cast<int>(count);
            fds[count++] = {out.read.get(), POLLIN, 0};
        }
        if (errOpen) {
            errIdx = static_cast<int>(count);
            fds[count++] = {err.read.get(), POLLIN, 0};
        }
        if (in.write.get() >= 0) {
            inIdx = static_cast<int>(count);
            fds[count++] = {in.write.get(), POLLOUT, 0};
        }

        const int ready = ::poll(fds, count, waitMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR("Process: poll() failed: {}", std::strerror(errno));
            killAndReap(pid);
            return result;
        }
        if (ready == 0) {
            continue;
        }

        if (outIdx >= 0 && fds[outIdx].revents != 0) {
            outOpen = drainFd(out.read.get(), result.output, maxOutputBytes_);
        }
        if (errIdx >= 0 && fds[errIdx].revents != 0) {
            errOpen = drainFd(err.read.get(), result.errorOutput, maxOutputBytes_);
        }
        if (inIdx >= 0 && fds[inIdx].revents != 0) {
            if (fds[inIdx].revents & (POLLERR | POLLHUP)) {
                in.write.reset();
                continue;
            }
            const ssize_t n =
                ::write(in.write.get(), input->data() + written, input->size() - written);
            if (n > 0) {
                written += static_cast<size_t>(n);
            } else if (n < 0 && errno != EAGAIN && errno != EINTR) {
                in.write.reset();
            }
            if (written >= input->size()) {
                in.write.reset();
            }
        }
    }

    int status = 0;
    if (!timedOut) {
        // Output closed; give the process the rest of the budget to exit
        for (;;) {
            const pid_t ret = ::waitpid(pid, &status, WNOHANG);
            if (ret == pid) {
                break;
            }
            if (ret < 0 && errno != EINTR) {
                LOG_ERROR("Process: waitpid() failed: {}", std::strerror(errno));
                return result;
            }
            if (remainingMs(deadline) <= 0) {
                timedOut = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    if (timedOut) {
        killAndReap(pid);
        result.status = CommandResult::Status::TimedOut;
        LOG_WARN("Process: '{}' timed out after {} ms", argv[0], timeout.count());
        return result;
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exitCode = 128 + WTERMSIG(status);
    }
    result.status =
        result.exitCode == 0 ? CommandResult::Status::Ok : CommandResult::Status::Failed;
    return result;
}

}  // namespace Process

#ifndef CLIPBOARD_H
#define CLIPBOARD_H

#include "core/process_runner.h"
#include "injection/paste_strategy.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace TextInjection {

// System clipboard access. Failures are reported through return values, never thrown.
class ClipboardBackend {
   public:
    virtual ~ClipboardBackend() = default;

    // nullopt when the clipboard could not be read
    virtual std::optional<std::string> read() = 0;

    virtual bool write(const std::string& text) = 0;

    virtual std::string name() const = 0;
};

// Read/write command pair for one clipboard tool
struct ClipboardCommands {
    std::string name;
    std::vector<std::string> readArgv;
    std::vector<std::string> writeArgv;
};

std::vector<ClipboardCommands> defaultClipboardCommands(PlatformFamily family);

// Clipboard through external tools, tried in order. The tool that last succeeded is
// tried first next time.
class CommandClipboard : public ClipboardBackend {
   public:
    CommandClipboard(std::vector<ClipboardCommands> tools,
                     std::shared_ptr<Process::CommandRunner> runner,
                     std::chrono::milliseconds timeout);

    std::optional<std::string> read() override;
    bool write(const std::string& text) override;
    std::string name() const override;

   private:
    std::vector<size_t> attemptOrder() const;

    std::vector<ClipboardCommands> tools_;
    std::shared_ptr<Process::CommandRunner> runner_;
    std::chrono::milliseconds timeout_;

    mutable std::mutex mutex_;
    size_t preferred_ = 0;
};

}  // namespace TextInjection

#endif  // CLIPBOARD_H

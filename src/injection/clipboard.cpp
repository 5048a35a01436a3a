#include "injection/clipboard.h"

#include "logging/logger.h"

#include <utility>

namespace TextInjection {

namespace {

const ClipboardCommands kWlClipboard = {"wl-clipboard", {"wl-paste", "--no-newline"}, {"wl-copy"}};
const ClipboardCommands kXclip = {"xclip",
                                  {"xclip", "-selection", "clipboard", "-o"},
                                  {"xclip", "-selection", "clipboard"}};
const ClipboardCommands kXsel = {"xsel", {"xsel", "--clipboard", "--output"},
                                 {"xsel", "--clipboard", "--input"}};
const ClipboardCommands kPasteboard = {"pbcopy", {"pbpaste"}, {"pbcopy"}};
const ClipboardCommands kPowerShell = {
    "powershell", {"powershell.exe", "-NoProfile", "-Command", "Get-Clipboard -Raw"}, {"clip.exe"}};

}  // namespace

std::vector<ClipboardCommands> defaultClipboardCommands(PlatformFamily family) {
    switch (family) {
    case PlatformFamily::Wayland:
        // XWayland clipboard as a fallback when wl-clipboard is missing
        return {kWlClipboard, kXclip, kXsel};
    case PlatformFamily::X11:
        return {kXclip, kXsel};
    case PlatformFamily::MacOS:
        return {kPasteboard};
    case PlatformFamily::Windows:
        return {kPowerShell};
    case PlatformFamily::Unknown:
        break;
    }
    return {kWlClipboard, kXclip, kXsel};
}

CommandClipboard::CommandClipboard(std::vector<ClipboardCommands> tools,
                                   std::shared_ptr<Process::CommandRunner> runner,
                                   std::chrono::milliseconds timeout)
    : tools_(std::move(tools)), runner_(std::move(runner)), timeout_(timeout) {}

std::string CommandClipboard::name() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_.empty() ? std::string("none") : tools_[preferred_].name;
}

std::vector<size_t> CommandClipboard::attemptOrder() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<size_t> order;
    order.reserve(tools_.size());
    if (!tools_.empty()) {
        order.push_back(preferred_);
    }
    for (size_t i = 0; i < tools_.size(); ++i) {
        if (i != preferred_) {
            order.push_back(i);
        }
    }
    return order;
}

std::optional<std::string> CommandClipboard::read() {
    for (size_t index : attemptOrder()) {
        const ClipboardCommands& tool = tools_[index];
        Process::CommandRequest request;
        request.argv = tool.readArgv;
        request.timeout = timeout_;
        const Process::CommandResult result = runner_->run(request);
        if (result.ok()) {
            std::lock_guard<std::mutex> lock(mutex_);
            preferred_ = index;
            return result.output;
        }
        LOG_DEBUG("Clipboard: read via {} failed ({})", tool.name,
                  Process::statusToString(result.status));
    }
    LOG_WARN("Clipboard: could not read current contents");
    return std::nullopt;
}

bool CommandClipboard::write(const std::string& text) {
    for (size_t index : attemptOrder()) {
        const ClipboardCommands& tool = tools_[index];
        Process::CommandRequest request;
        request.argv = tool.writeArgv;
        request.input = text;
        request.timeout = timeout_;
        request.captureOutput = false;
        const Process::CommandResult result = runner_->run(request);
        if (result.ok()) {
            std::lock_guard<std::mutex> lock(mutex_);
            preferred_ = index;
            return true;
        }
        LOG_DEBUG("Clipboard: write via {} failed ({})", tool.name,
                  Process::statusToString(result.status));
    }
    LOG_ERROR("Clipboard: could not write {} bytes", text.size());
    return false;
}

}  // namespace TextInjection

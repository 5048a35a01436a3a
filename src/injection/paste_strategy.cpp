#include "injection/paste_strategy.h"

#include "core/error_codes.h"

#include <algorithm>
#include <cctype>

namespace TextInjection {

namespace {

// Strategy table. Adding a platform or tool means adding a row here and naming it in
// the per-family order below.
const std::vector<PasteCommand> kKnownStrategies = {
    {"wtype-ctrl-v", {"wtype", "-M", "ctrl", "v", "-m", "ctrl"}},
    {"ydotool-ctrl-v", {"ydotool", "key", "ctrl+v"}},
    {"wtype-shift-insert", {"wtype", "-M", "shift", "-k", "Insert", "-m", "shift"}},
    {"xdotool-ctrl-v", {"xdotool", "key", "--clearmodifiers", "ctrl+v"}},
    {"xdotool-shift-insert", {"xdotool", "key", "--clearmodifiers", "shift+Insert"}},
    {"osascript-cmd-v",
     {"osascript", "-e", "tell application \"System Events\" to keystroke \"v\" using command down"}},
    {"powershell-sendkeys",
     {"powershell.exe", "-NoProfile", "-Command",
      "Add-Type -AssemblyName System.Windows.Forms; "
      "[System.Windows.Forms.SendKeys]::SendWait('^v')"}},
};

const std::vector<std::string> kWaylandOrder = {"wtype-ctrl-v", "ydotool-ctrl-v",
                                                "wtype-shift-insert", "xdotool-ctrl-v"};
const std::vector<std::string> kX11Order = {"xdotool-ctrl-v", "xdotool-shift-insert"};
const std::vector<std::string> kMacOrder = {"osascript-cmd-v"};
const std::vector<std::string> kWindowsOrder = {"powershell-sendkeys"};

std::string toLower(const std::string& s) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

bool isSet(const GetenvFn& getenvFn, const char* name) {
    const char* value = getenvFn ? getenvFn(name) : nullptr;
    return value != nullptr && value[0] != '\0';
}

}  // namespace

const char* platformFamilyToString(PlatformFamily family) {
    switch (family) {
    case PlatformFamily::Wayland:
        return "wayland";
    case PlatformFamily::X11:
        return "x11";
    case PlatformFamily::MacOS:
        return "macos";
    case PlatformFamily::Windows:
        return "windows";
    case PlatformFamily::Unknown:
        break;
    }
    return "unknown";
}

std::optional<PlatformFamily> parsePlatformFamily(const std::string& name) {
    const std::string lower = toLower(name);
    if (lower == "wayland") {
        return PlatformFamily::Wayland;
    }
    if (lower == "x11") {
        return PlatformFamily::X11;
    }
    if (lower == "macos") {
        return PlatformFamily::MacOS;
    }
    if (lower == "windows") {
        return PlatformFamily::Windows;
    }
    return std::nullopt;
}

PlatformFamily detectPlatformFamily(const GetenvFn& getenvFn) {
#if defined(__APPLE__)
    (void)getenvFn;
    return PlatformFamily::MacOS;
#else
    if (isSet(getenvFn, "WAYLAND_DISPLAY")) {
        return PlatformFamily::Wayland;
    }
    if (isSet(getenvFn, "DISPLAY")) {
        return PlatformFamily::X11;
    }
    if (isSet(getenvFn, "WSL_DISTRO_NAME")) {
        return PlatformFamily::Windows;
    }
    return PlatformFamily::Unknown;
#endif
}

const std::vector<PasteCommand>& knownPasteStrategies() {
    return kKnownStrategies;
}

std::optional<PasteCommand> findPasteStrategy(const std::string& name) {
    auto it = std::find_if(kKnownStrategies.begin(), kKnownStrategies.end(),
                           [&name](const PasteCommand& cmd) { return cmd.name == name; });
    if (it == kKnownStrategies.end()) {
        return std::nullopt;
    }
    return *it;
}

std::vector<PasteCommand> defaultPasteStrategies(PlatformFamily family) {
    switch (family) {
    case PlatformFamily::Wayland:
        return resolvePasteStrategies(kWaylandOrder);
    case PlatformFamily::X11:
        return resolvePasteStrategies(kX11Order);
    case PlatformFamily::MacOS:
        return resolvePasteStrategies(kMacOrder);
    case PlatformFamily::Windows:
        return resolvePasteStrategies(kWindowsOrder);
    case PlatformFamily::Unknown:
        break;
    }
    // Unknown session: X11 tools are the most widely installed
    return resolvePasteStrategies(kX11Order);
}

std::vector<PasteCommand> resolvePasteStrategies(const std::vector<std::string>& names) {
    std::vector<PasteCommand> resolved;
    resolved.reserve(names.size());
    for (const auto& name : names) {
        auto cmd = findPasteStrategy(name);
        if (!cmd) {
            throw DictationEngine::ConfigError(DictationEngine::ErrorCode::VALIDATION_UNKNOWN_STRATEGY,
                                               "unknown paste strategy '" + name + "'");
        }
        resolved.push_back(std::move(*cmd));
    }
    return resolved;
}

}  // namespace TextInjection

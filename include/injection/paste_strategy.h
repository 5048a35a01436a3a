#ifndef PASTE_STRATEGY_H
#define PASTE_STRATEGY_H

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace TextInjection {

enum class PlatformFamily { Wayland, X11, MacOS, Windows, Unknown };

const char* platformFamilyToString(PlatformFamily family);

// Accepts "wayland", "x11", "macos", "windows" (case-insensitive)
std::optional<PlatformFamily> parsePlatformFamily(const std::string& name);

using GetenvFn = std::function<const char*(const char*)>;

// WAYLAND_DISPLAY -> Wayland, DISPLAY -> X11, WSL_DISTRO_NAME -> Windows (WSL).
// macOS builds always report MacOS.
PlatformFamily detectPlatformFamily(const GetenvFn& getenvFn);

// One way of simulating a paste keystroke in the focused window
struct PasteCommand {
    std::string name;
    std::vector<std::string> argv;
};

// Every strategy this build knows, by name
const std::vector<PasteCommand>& knownPasteStrategies();

std::optional<PasteCommand> findPasteStrategy(const std::string& name);

// Default order per platform family, most reliable first
std::vector<PasteCommand> defaultPasteStrategies(PlatformFamily family);

// Resolve configured names in order. Throws DictationEngine::ConfigError for an unknown name.
std::vector<PasteCommand> resolvePasteStrategies(const std::vector<std::string>& names);

}  // namespace TextInjection

#endif  // PASTE_STRATEGY_H

#pragma once
#include <cstdlib>
#include <filesystem>
#include <string>

/**
 * @brief Per-user locations following the XDG base directory layout.
 *
 * $XDG_CONFIG_HOME/uts and $XDG_DATA_HOME/uts, falling back to ~/.config/uts and
 * ~/.local/share/uts. Relative XDG values are ignored. Without HOME, ".uts" in the
 * working directory.
 */
namespace Paths {
    inline std::filesystem::path baseDir(const char* xdgVar, const char* homeRelative) {
        const char* xdg = std::getenv(xdgVar);
        if (xdg && *xdg && std::filesystem::path(xdg).is_absolute()) {
            return std::filesystem::path(xdg) / "uts";
        }
        const char* home = std::getenv("HOME");
        if (home && *home) {
            return std::filesystem::path(home) / homeRelative / "uts";
        }
        return std::filesystem::path(".uts");
    }

    inline std::string configHome() { return baseDir("XDG_CONFIG_HOME", ".config").string(); }
    inline std::string dataHome() { return baseDir("XDG_DATA_HOME", ".local/share").string(); }

    /** @brief Config file used when neither -c nor ./uts.json is given. */
    inline std::string userConfigFile() {
        return (baseDir("XDG_CONFIG_HOME", ".config") / "config.json").string();
    }

    inline std::string dataFile(const std::string& name) {
        return (baseDir("XDG_DATA_HOME", ".local/share") / name).string();
    }
}

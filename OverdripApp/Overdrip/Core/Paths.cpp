#include "Paths.h"
#include <cstdlib>

namespace od::Paths {

    static std::filesystem::path HomeDir() {
        if (const char* home = std::getenv("HOME"); home && *home) return home;
        return std::filesystem::current_path();
    }

    std::filesystem::path ConfigDir() {
        if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
            return std::filesystem::path(xdg) / "overdrip";
        return HomeDir() / ".config" / "overdrip";
    }

    std::filesystem::path DefaultConfigPath() {
        return ConfigDir() / "config.toml";
    }

    std::filesystem::path DefaultTokenPath() {
        return ConfigDir() / "auth.json";
    }

}

#pragma once
#include <filesystem>

namespace od::Paths {

    // $XDG_CONFIG_HOME/overdrip, o ~/.config/overdrip si no está definido
    std::filesystem::path ConfigDir();
    std::filesystem::path DefaultConfigPath();
    std::filesystem::path DefaultTokenPath();

}

#pragma once
#include <string>
#include <optional>
#include <filesystem>

namespace od {

    enum class Command { Run, Login, Logout, ConfigShow, ConfigEdit, Help };

    struct CommandLine {
        std::optional<std::filesystem::path> config_path;   // -c / --config
        bool verbose = false;                                // -v / --verbose
        Command command = Command::Help;
    };

    std::optional<CommandLine> ParseCommandLine(int argc, const char* const* argv, std::string* err = nullptr);
    std::string Usage(const std::string& program);

}

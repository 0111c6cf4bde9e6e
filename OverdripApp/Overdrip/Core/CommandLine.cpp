#include "CommandLine.h"
#include <sstream>
#include <vector>

namespace od {

    std::string Usage(const std::string& program) {
        std::ostringstream oss;
        oss << "Usage: " << program << " [-c|--config <path>] [-v|--verbose] <command>\n"
            << "\n"
            << "Commands:\n"
            << "  run            Run the Overdrip service\n"
            << "  login          Authenticate with the service\n"
            << "  logout         Remove stored credentials\n"
            << "  config show    Show the current configuration\n"
            << "  config edit    Edit the configuration file\n";
        return oss.str();
    }

    std::optional<CommandLine> ParseCommandLine(int argc, const char* const* argv, std::string* err) {
        CommandLine cl;
        std::vector<std::string> positional;

        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "-h" || arg == "--help") {
                cl.command = Command::Help;
                return cl;
            }
            if (arg == "-v" || arg == "--verbose") {
                cl.verbose = true;
                continue;
            }
            if (arg == "-c" || arg == "--config") {
                if (i + 1 >= argc) {
                    if (err) *err = "missing value for " + arg;
                    return std::nullopt;
                }
                cl.config_path = std::filesystem::path(argv[++i]);
                continue;
            }
            if (arg.rfind("--config=", 0) == 0) {
                cl.config_path = std::filesystem::path(arg.substr(9));
                continue;
            }
            if (!arg.empty() && arg[0] == '-') {
                if (err) *err = "unknown option: " + arg;
                return std::nullopt;
            }
            positional.push_back(arg);
        }

        if (positional.empty()) {
            if (err) *err = "missing command";
            return std::nullopt;
        }

        const std::string& cmd = positional[0];
        size_t expected = 1;
        if (cmd == "run") cl.command = Command::Run;
        else if (cmd == "login") cl.command = Command::Login;
        else if (cmd == "logout") cl.command = Command::Logout;
        else if (cmd == "config") {
            expected = 2;
            if (positional.size() < 2) {
                if (err) *err = "config requires a subcommand (show, edit)";
                return std::nullopt;
            }
            if (positional[1] == "show") cl.command = Command::ConfigShow;
            else if (positional[1] == "edit") cl.command = Command::ConfigEdit;
            else {
                if (err) *err = "unknown config subcommand: " + positional[1];
                return std::nullopt;
            }
        }
        else {
            if (err) *err = "unknown command: " + cmd;
            return std::nullopt;
        }

        if (positional.size() > expected) {
            if (err) *err = "unexpected argument: " + positional[expected];
            return std::nullopt;
        }
        return cl;
    }

}

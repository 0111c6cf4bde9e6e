#include "Core/Application.h"
#include "Core/CommandLine.h"
#include "Core/Config.h"
#include "Core/ConsoleLogSink.h"
#include "Core/Log.h"
#include "Core/Paths.h"
#include "Auth/ClientCredentials.h"
#include <cstdlib>
#include <exception>
#include <iostream>
#include <sstream>

using namespace od;

static int run(int argc, char** argv) {
    std::string err;
    auto cl = ParseCommandLine(argc, argv, &err);
    if (!cl) {
        std::cerr << "error: " << err << "\n\n" << Usage(argv[0]);
        return 2;
    }
    if (cl->command == Command::Help) {
        std::cout << Usage(argv[0]);
        return 0;
    }

    // Por defecto solo warnings y errores; OVERDRIP_LOG=debug equivale a -v
    Log::SetLevel(LogLevel::Warn);
    if (const char* lvl = std::getenv("OVERDRIP_LOG"); lvl && *lvl) Log::SetLevel(Log::ParseLevel(lvl));
    if (cl->verbose) Log::SetLevel(LogLevel::Debug);

    const auto configPath = cl->config_path.value_or(Paths::DefaultConfigPath());
    Log::Info("using config path: '" + configPath.string() + "'");

    auto cfg = ConfigSerializer::Load(configPath, &err);
    if (!cfg) {
        Log::Error(err);
        return 1;
    }
    if (Log::Enabled(LogLevel::Debug)) {
        std::ostringstream dump;
        dump << ConfigSerializer::Dump(*cfg);
        Log::Debug("config\n" + dump.str());
    }

    // Credenciales del cliente: una sola vez, inmutables
    const ClientCredentials creds = ClientCredentials::FromBuild();
    Application app(std::move(*cfg), creds, configPath);

    bool ok = true;
    switch (cl->command) {
    case Command::Run:        app.Run(std::cout); break;
    case Command::Login:
        ok = app.Login(&err);
        if (ok) std::cout << "Login successful." << std::endl;
        break;
    case Command::Logout:
        ok = app.Logout(&err);
        if (ok) std::cout << "Logged out." << std::endl;
        break;
    case Command::ConfigShow: app.ShowConfig(std::cout); break;
    case Command::ConfigEdit: ok = app.EditConfig(&err); break;
    case Command::Help:       break;
    }

    if (!ok) {
        Log::Error("Error: " + err);
        return 1;
    }
    return 0;
}

int main(int argc, char** argv) {
    static ConsoleLogSink s_sink;
    Log::SetSink(&s_sink);

    try {
        return run(argc, argv);
    }
    catch (const std::exception& e) {
        Log::Error(std::string("fatal: ") + e.what());
        return 1;
    }
}

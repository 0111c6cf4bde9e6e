#pragma once
#include <string>
#include <filesystem>
#include <iosfwd>
#include "Core/Config.h"
#include "Auth/ClientCredentials.h"

namespace od {

    // Ejecuta `editor` con `file` como único argumento (sin shell) y espera a que termine.
    // Solo falla si el programa no se pudo lanzar; un código de salida distinto de 0 se registra.
    bool LaunchEditor(const std::string& editor, const std::filesystem::path& file, std::string* err = nullptr);

    // Acciones de la CLI sobre una config ya cargada.
    class Application {
    public:
        Application(Config cfg, const ClientCredentials& creds, std::filesystem::path configPath)
            : m_Config(std::move(cfg)), m_Creds(creds), m_ConfigPath(std::move(configPath)) {
        }

        void Run(std::ostream& out) const;
        bool Login(std::string* err = nullptr);
        bool Logout(std::string* err = nullptr);
        void ShowConfig(std::ostream& out) const;
        bool EditConfig(std::string* err = nullptr) const;

        const Config& GetConfig() const { return m_Config; }

    private:
        Config m_Config;
        const ClientCredentials& m_Creds;
        std::filesystem::path m_ConfigPath;
    };

}

#pragma once
#include <string>
#include <optional>
#include <filesystem>
#include <string_view>
#include <toml++/toml.hpp>

namespace od {

    struct MonitorConfig {
        int interval = 60;        // segundos entre chequeos
        double threshold = 0.8;
    };

    struct ServerConfig {
        int port = 8080;
    };

    struct AuthConfig {
        std::string token_path;       // vacío => Paths::DefaultTokenPath()
        int callback_timeout_sec = 0; // 0 => esperar indefinidamente el callback
        bool open_browser = false;
    };

    struct Config {
        MonitorConfig monitor;
        ServerConfig server;
        AuthConfig auth;

        std::filesystem::path TokenPath() const;
    };

    class ConfigSerializer {
    public:
        // Si el archivo no existe devuelve la config por defecto.
        static std::optional<Config> Load(const std::filesystem::path& path, std::string* err = nullptr);
        static bool Save(const Config& cfg, const std::filesystem::path& path, std::string* err = nullptr);

        static toml::table Dump(const Config& cfg);
        // Las claves ausentes conservan el valor por defecto
        static bool LoadFromToml(Config& cfg, const toml::table& tbl, std::string* err = nullptr);
        // Texto TOML completo (sin archivo); `source` solo se usa en los mensajes de error
        static std::optional<Config> Parse(std::string_view text, std::string* err = nullptr,
            std::string_view source = "<config>");
    };

}

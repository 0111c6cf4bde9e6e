#include "Config.h"
#include "Paths.h"
#include <cstdint>
#include <fstream>
#include <iterator>
#include <system_error>

namespace od {

    std::filesystem::path Config::TokenPath() const {
        if (auth.token_path.empty()) return Paths::DefaultTokenPath();
        return auth.token_path;
    }

    // Ausente => deja `out` como está. Presente con otro tipo => error.
    template <typename T>
    static bool read_field(const toml::table& tbl, std::string_view section, std::string_view key,
        T& out, std::string* err) {
        auto node = tbl[section][key];
        if (!node) return true;
        auto v = node.value<T>();
        if (!v) {
            if (err) *err = "invalid value for " + std::string(section) + "." + std::string(key);
            return false;
        }
        out = *v;
        return true;
    }

    toml::table ConfigSerializer::Dump(const Config& cfg) {
        return toml::table{
            {"monitor", toml::table{
                {"interval", cfg.monitor.interval},
                {"threshold", cfg.monitor.threshold}
            }},
            {"server", toml::table{
                {"port", cfg.server.port}
            }},
            {"auth", toml::table{
                {"token_path", cfg.auth.token_path},
                {"callback_timeout_sec", cfg.auth.callback_timeout_sec},
                {"open_browser", cfg.auth.open_browser}
            }}
        };
    }

    bool ConfigSerializer::LoadFromToml(Config& cfg, const toml::table& tbl, std::string* err) {
        if (!read_field(tbl, "monitor", "interval", cfg.monitor.interval, err)) return false;
        if (!read_field(tbl, "monitor", "threshold", cfg.monitor.threshold, err)) return false;
        if (!read_field(tbl, "server", "port", cfg.server.port, err)) return false;
        if (!read_field(tbl, "auth", "token_path", cfg.auth.token_path, err)) return false;
        if (!read_field(tbl, "auth", "callback_timeout_sec", cfg.auth.callback_timeout_sec, err)) return false;
        if (!read_field(tbl, "auth", "open_browser", cfg.auth.open_browser, err)) return false;

        if (cfg.monitor.interval <= 0) {
            if (err) *err = "monitor.interval must be positive";
            return false;
        }
        if (cfg.server.port <= 0 || cfg.server.port > 65535) {
            if (err) *err = "server.port out of range: " + std::to_string(cfg.server.port);
            return false;
        }
        if (cfg.auth.callback_timeout_sec < 0) {
            if (err) *err = "auth.callback_timeout_sec must not be negative";
            return false;
        }
        return true;
    }

    std::optional<Config> ConfigSerializer::Parse(std::string_view text, std::string* err, std::string_view source) {
        toml::table tbl;
        try {
            tbl = toml::parse(text, source);
        }
        catch (const toml::parse_error& e) {
            if (err) *err = "failed to parse " + std::string(source) + " (line " +
                std::to_string(e.source().begin.line) + "): " + std::string(e.description());
            return std::nullopt;
        }

        Config cfg;
        std::string why;
        if (!LoadFromToml(cfg, tbl, &why)) {
            if (err) *err = std::string(source) + ": " + why;
            return std::nullopt;
        }
        return cfg;
    }

    std::optional<Config> ConfigSerializer::Load(const std::filesystem::path& path, std::string* err) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) return Config{};

        std::ifstream ifs(path);
        if (!ifs) {
            if (err) *err = "failed to open config file: " + path.string();
            return std::nullopt;
        }
        const std::string text((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
        return Parse(text, err, path.string());
    }

    bool ConfigSerializer::Save(const Config& cfg, const std::filesystem::path& path, std::string* err) {
        std::error_code ec;
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path(), ec);
            if (ec) {
                if (err) *err = "failed to create config directory: " + ec.message();
                return false;
            }
        }
        std::ofstream ofs(path, std::ios::out | std::ios::trunc);
        if (!ofs) {
            if (err) *err = "failed to open config file for writing: " + path.string();
            return false;
        }
        ofs << Dump(cfg) << '\n';
        if (!ofs) {
            if (err) *err = "failed to write config file: " + path.string();
            return false;
        }
        return true;
    }

}

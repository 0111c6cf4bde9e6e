#pragma once
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace od {

struct TokenSet {
    std::string access_token;
    std::string refresh_token;   // vacío si el proveedor no lo emitió
    long long   expires_in = 0;  // segundos

    bool operator==(const TokenSet&) const = default;
};

nlohmann::json TokenSetToJson(const TokenSet& t);

// Mismas reglas que TokenSetFromJson, sobre un valor ya armado.
bool ValidateTokenSet(const TokenSet& t, std::string* err = nullptr);

// Exige access_token no vacío y expires_in entero >= 0.
std::optional<TokenSet> TokenSetFromJson(const nlohmann::json& j, std::string* err = nullptr);

}

#pragma once
#include <string>
#include <optional>
#include "TokenSet.h"

namespace od {

// Donde quedan los tokens después del login. El flujo de login solo conoce esta interfaz.
class TokenStore {
public:
    virtual ~TokenStore() = default;

    // Reemplaza por completo lo guardado (nunca agrega)
    virtual bool Save(const TokenSet& tokens, std::string* err = nullptr) = 0;

    // true + out vacío => no hay tokens guardados. false => error de lectura/parseo.
    virtual bool Load(std::optional<TokenSet>& out, std::string* err = nullptr) const = 0;

    // Borrar un store vacío no es error
    virtual bool Clear(std::string* err = nullptr) = 0;
};

class MemoryTokenStore : public TokenStore {
public:
    bool Save(const TokenSet& tokens, std::string* err = nullptr) override {
        std::string why;
        if (!ValidateTokenSet(tokens, &why)) {
            if (err) *err = "refusing to save invalid tokens: " + why;
            return false;
        }
        m_Tokens = tokens;
        return true;
    }
    bool Load(std::optional<TokenSet>& out, std::string* = nullptr) const override { out = m_Tokens; return true; }
    bool Clear(std::string* = nullptr) override { m_Tokens.reset(); return true; }

private:
    std::optional<TokenSet> m_Tokens;
};

}

#pragma once
#include <string>
#include <optional>
#include "AuthError.h"
#include "ClientCredentials.h"
#include "TokenSet.h"

namespace od {

// Intercambia el authorization code (+ verifier PKCE) por tokens. Un solo intento, sin reintentos.
class TokenExchanger {
public:
    TokenExchanger(const ClientCredentials& creds, std::string token_endpoint, std::string redirect_uri)
        : m_Creds(creds), m_TokenEndpoint(std::move(token_endpoint)), m_RedirectUri(std::move(redirect_uri)) {
    }

    std::optional<TokenSet> Exchange(const std::string& code, const std::string& verifier,
        AuthError* err = nullptr) const;

    void SetTimeouts(int connectSec, int totalSec) {
        m_ConnectTimeoutSec = connectSec;
        m_TimeoutSec = totalSec;
    }

private:
    const ClientCredentials& m_Creds;
    std::string m_TokenEndpoint;
    std::string m_RedirectUri;

    int m_ConnectTimeoutSec = 10;
    int m_TimeoutSec = 30;
};

}

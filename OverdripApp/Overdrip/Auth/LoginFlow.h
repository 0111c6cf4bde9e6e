#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <functional>
#include "AuthError.h"
#include "ClientCredentials.h"
#include "LoopbackServer.h"
#include "PKCE.h"
#include "TokenStore.h"

namespace od {

struct OAuthConfig {
    std::string authorize_endpoint = "https://accounts.google.com/o/oauth2/v2/auth";
    std::string token_endpoint = "https://oauth2.googleapis.com/token";
    std::vector<std::string> scopes{ "openid", "email", "profile" };
    CallbackEndpoint callback;
};

// Login interactivo: PKCE -> URL -> callback -> exchange -> store.
class LoginFlow {
public:
    using PkceSource = std::function<PkceChallenge()>;
    using UrlPresenter = std::function<void(const std::string& url)>;

    LoginFlow(const ClientCredentials& creds, OAuthConfig cfg, TokenStore& store);

    // Cada llamada es un intento nuevo: par PKCE, URL y listener propios.
    bool Login(AuthError* err = nullptr);

    std::string BuildAuthorizationUrl(const PkceChallenge& pkce) const;

    void SetPkceSource(PkceSource fn) { m_PkceSource = std::move(fn); }
    void SetPresenter(UrlPresenter fn) { m_Presenter = std::move(fn); }
    void SetCallbackTimeout(std::chrono::seconds timeout) { m_CallbackTimeout = timeout; }

private:
    const ClientCredentials& m_Creds;
    OAuthConfig m_Cfg;
    TokenStore& m_Store;

    PkceSource m_PkceSource = GeneratePkceChallenge;
    UrlPresenter m_Presenter;
    std::chrono::seconds m_CallbackTimeout{ 0 };
};

// xdg-open / open. Devuelve false si no se pudo lanzar el navegador.
bool OpenInBrowser(const std::string& url);

}

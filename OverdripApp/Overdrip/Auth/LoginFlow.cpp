#include "LoginFlow.h"
#include "TokenExchanger.h"
#include "Core/Log.h"
#include <cpr/cpr.h>
#include <cpr/util.h>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace od {

// ---------- helpers ----------
static std::string join_scopes(const std::vector<std::string>& scopes) {
    std::ostringstream oss;
    for (size_t i = 0; i < scopes.size(); ++i) {
        if (i) oss << ' ';
        oss << scopes[i];
    }
    return oss.str();
}

static inline std::string enc(const std::string& s) {
    return cpr::util::urlEncode(s);
}

bool OpenInBrowser(const std::string& url) {
#ifdef __APPLE__
    const std::string cmd = "open \"" + url + "\" >/dev/null 2>&1";
#else
    const std::string cmd = "xdg-open \"" + url + "\" >/dev/null 2>&1";
#endif
    return std::system(cmd.c_str()) == 0;
}

// ---------- LoginFlow ----------
LoginFlow::LoginFlow(const ClientCredentials& creds, OAuthConfig cfg, TokenStore& store)
    : m_Creds(creds), m_Cfg(std::move(cfg)), m_Store(store) {
    m_Presenter = [](const std::string& url) {
        std::cout << "Login at: " << url << std::endl;
    };
}

std::string LoginFlow::BuildAuthorizationUrl(const PkceChallenge& pkce) const {
    // redirect_uri va tal cual: ':' y '/' son válidos dentro de la query
    return m_Cfg.authorize_endpoint
        + "?client_id=" + enc(m_Creds.client_id)
        + "&redirect_uri=" + m_Cfg.callback.RedirectUri()
        + "&response_type=code"
        + "&scope=" + enc(join_scopes(m_Cfg.scopes))
        + "&code_challenge=" + enc(pkce.challenge)
        + "&code_challenge_method=S256";
}

bool LoginFlow::Login(AuthError* err) {
    PkceChallenge pkce;
    try {
        pkce = m_PkceSource();
    }
    catch (const std::runtime_error& e) {
        SetError(err, AuthErrorKind::EntropyFailure, "could not generate PKCE verifier", e.what());
        return false;
    }

    // Bind antes de mostrar la URL: si el puerto está ocupado no tiene sentido mandar al usuario al navegador
    LoopbackServer server(m_Cfg.callback);
    if (!server.Start(err)) return false;

    const std::string url = BuildAuthorizationUrl(pkce);
    Log::Debug("authorization url: " + url);
    m_Presenter(url);

    auto code = server.WaitForCode(m_CallbackTimeout, err);
    if (!code) return false;
    Log::Info("authorization code received, exchanging for tokens");

    // Mismo verifier del intento que generó el challenge
    TokenExchanger exchanger(m_Creds, m_Cfg.token_endpoint, server.RedirectUri());
    auto tokens = exchanger.Exchange(*code, pkce.verifier, err);
    if (!tokens) return false;

    std::string why;
    if (!m_Store.Save(*tokens, &why)) {
        SetError(err, AuthErrorKind::TokenPersistence,
            "authentication succeeded but the tokens could not be saved: " + why);
        return false;
    }

    Log::Info("login successful, tokens saved");
    return true;
}

}

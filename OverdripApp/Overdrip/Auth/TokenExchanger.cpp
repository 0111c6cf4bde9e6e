#include "TokenExchanger.h"
#include "Core/Log.h"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <chrono>

namespace od {

std::optional<TokenSet> TokenExchanger::Exchange(const std::string& code, const std::string& verifier,
    AuthError* err) const {
    cpr::Payload form{
        {"code", code},
        {"client_id", m_Creds.client_id},
        {"client_secret", m_Creds.client_secret},
        {"code_verifier", verifier},
        {"redirect_uri", m_RedirectUri},
        {"grant_type", "authorization_code"}
    };
    Log::Debug("requesting tokens from " + m_TokenEndpoint);

    auto res = cpr::Post(
        cpr::Url{ m_TokenEndpoint },
        cpr::Header{ {"Content-Type", "application/x-www-form-urlencoded"}, {"Accept", "application/json"} },
        form,
        cpr::ConnectTimeout{ std::chrono::seconds(m_ConnectTimeoutSec) },
        cpr::Timeout{ std::chrono::seconds(m_TimeoutSec) }
    );

    if (res.error.code != cpr::ErrorCode::OK) {
        SetError(err, AuthErrorKind::ExchangeTransport, "request to " + m_TokenEndpoint + " failed: " + res.error.message);
        return std::nullopt;
    }

    // El body puede traer tokens: solo a nivel debug
    Log::Debug("token response: HTTP " + std::to_string(res.status_code) + " " + res.text);

    auto protocol_error = [&](const std::string& msg) {
        SetError(err, AuthErrorKind::ExchangeProtocol, msg, res.text);
        if (err) err->status = res.status_code;
    };

    if (res.status_code < 200 || res.status_code >= 300) {
        protocol_error("token endpoint returned HTTP " + std::to_string(res.status_code));
        return std::nullopt;
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(res.text);
    }
    catch (const nlohmann::json::parse_error& e) {
        protocol_error(std::string("invalid JSON in token response: ") + e.what());
        return std::nullopt;
    }

    std::string why;
    auto tokens = TokenSetFromJson(j, &why);
    if (!tokens) {
        protocol_error("unexpected token response: " + why);
        return std::nullopt;
    }
    return tokens;
}

}

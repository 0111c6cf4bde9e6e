#include "TokenSet.h"

using json = nlohmann::json;

namespace od {

json TokenSetToJson(const TokenSet& t) {
    return {
        {"access_token", t.access_token},
        {"refresh_token", t.refresh_token},
        {"expires_in", t.expires_in}
    };
}

bool ValidateTokenSet(const TokenSet& t, std::string* err) {
    if (t.access_token.empty()) {
        if (err) *err = "missing access_token";
        return false;
    }
    if (t.expires_in < 0) {
        if (err) *err = "missing or invalid expires_in";
        return false;
    }
    return true;
}

std::optional<TokenSet> TokenSetFromJson(const json& j, std::string* err) {
    if (!j.is_object()) {
        if (err) *err = "token payload is not a JSON object";
        return std::nullopt;
    }

    auto at = j.find("access_token");
    if (at == j.end() || !at->is_string() || at->get<std::string>().empty()) {
        if (err) *err = "missing access_token";
        return std::nullopt;
    }

    auto exp = j.find("expires_in");
    if (exp == j.end() || !exp->is_number_integer() || exp->get<long long>() < 0) {
        if (err) *err = "missing or invalid expires_in";
        return std::nullopt;
    }

    TokenSet t;
    t.access_token = at->get<std::string>();
    t.expires_in = exp->get<long long>();

    if (auto rt = j.find("refresh_token"); rt != j.end() && !rt->is_null()) {
        if (!rt->is_string()) {
            if (err) *err = "refresh_token is not a string";
            return std::nullopt;
        }
        t.refresh_token = rt->get<std::string>();
    }
    return t;
}

}

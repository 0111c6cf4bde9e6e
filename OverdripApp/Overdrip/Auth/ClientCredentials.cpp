#include "ClientCredentials.h"
#include <cstdlib>

#ifndef OVERDRIP_OAUTH_CLIENT_ID
#define OVERDRIP_OAUTH_CLIENT_ID ""
#endif
#ifndef OVERDRIP_OAUTH_CLIENT_SECRET
#define OVERDRIP_OAUTH_CLIENT_SECRET ""
#endif

namespace od {

static std::string build_or_env(const char* built, const char* env_name) {
    if (built && *built) return built;
    if (const char* v = std::getenv(env_name); v && *v) return v;
    return {};
}

ClientCredentials ClientCredentials::FromBuild() {
    return {
        .client_id = build_or_env(OVERDRIP_OAUTH_CLIENT_ID, "OVERDRIP_OAUTH_CLIENT_ID"),
        .client_secret = build_or_env(OVERDRIP_OAUTH_CLIENT_SECRET, "OVERDRIP_OAUTH_CLIENT_SECRET"),
    };
}

}

#pragma once
#include <string>

namespace od {

// Identidad del cliente OAuth. Se arma una sola vez en main y se pasa por referencia.
struct ClientCredentials {
    std::string client_id;
    std::string client_secret;

    bool Complete() const { return !client_id.empty() && !client_secret.empty(); }

    // Valores compilados (OVERDRIP_OAUTH_CLIENT_ID / _SECRET); si están vacíos
    // se toman de las variables de entorno con el mismo nombre.
    static ClientCredentials FromBuild();
};

}

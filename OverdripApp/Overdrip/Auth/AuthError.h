#pragma once
#include <string>
#include <utility>

namespace od {

enum class AuthErrorKind {
    EntropyFailure,
    ListenerBind,
    CallbackChannelClosed,
    ListenerTaskFailed,
    CallbackTimeout,
    ExchangeTransport,
    ExchangeProtocol,
    TokenPersistence,
};

const char* ToString(AuthErrorKind kind);

struct AuthError {
    AuthErrorKind kind = AuthErrorKind::ExchangeTransport;
    std::string message;   // una línea, para el usuario
    std::string detail;    // body crudo / causa anidada, para nivel debug
    long status = 0;       // HTTP status del token endpoint (ExchangeProtocol)

    // "<fase>: <mensaje>"
    std::string Describe() const;
};

// Helper para los out-params opcionales: if (err) *err = ...
inline void SetError(AuthError* err, AuthErrorKind kind, std::string message, std::string detail = {}) {
    if (!err) return;
    err->kind = kind;
    err->message = std::move(message);
    err->detail = std::move(detail);
    err->status = 0;
}

}

#include "AuthError.h"

namespace od {

const char* ToString(AuthErrorKind kind) {
    switch (kind) {
    case AuthErrorKind::EntropyFailure:        return "entropy failure";
    case AuthErrorKind::ListenerBind:          return "callback listener bind failed";
    case AuthErrorKind::CallbackChannelClosed: return "callback channel closed";
    case AuthErrorKind::ListenerTaskFailed:    return "callback listener failed";
    case AuthErrorKind::CallbackTimeout:       return "callback timed out";
    case AuthErrorKind::ExchangeTransport:     return "token exchange transport error";
    case AuthErrorKind::ExchangeProtocol:      return "token exchange protocol error";
    case AuthErrorKind::TokenPersistence:      return "token persistence error";
    }
    return "unknown error";
}

std::string AuthError::Describe() const {
    if (message.empty()) return ToString(kind);
    return std::string(ToString(kind)) + ": " + message;
}

}

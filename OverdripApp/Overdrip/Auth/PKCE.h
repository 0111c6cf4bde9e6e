#pragma once
#include <string>
#include <cstddef>

// PKCE = Proof Key for Code Exchange (RFC 7636)

namespace od {

inline constexpr std::size_t kPkceVerifierBytes = 32;

struct PkceChallenge {
    std::string verifier;   // base64url(32 bytes aleatorios), sin padding
    std::string challenge;  // base64url(SHA256(verifier)), sin padding
};

// Lanza std::runtime_error si el CSPRNG falla (no es recuperable).
PkceChallenge GeneratePkceChallenge();

// Deriva el challenge S256 de un verifier ya existente.
PkceChallenge PkceFromVerifier(std::string verifier);

}

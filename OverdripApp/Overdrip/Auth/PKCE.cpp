#include "PKCE.h"
#include <array>
#include <utility>
#include <stdexcept>
#include <openssl/rand.h>
#include <picosha2.h>
#include <cppcodec/base64_url_unpadded.hpp>

namespace od {

static std::string random_verifier() {
    std::array<unsigned char, kPkceVerifierBytes> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1)
        throw std::runtime_error("RAND_bytes failed: no secure entropy for PKCE verifier");
    return cppcodec::base64_url_unpadded::encode(bytes.data(), bytes.size());
}

PkceChallenge PkceFromVerifier(std::string verifier) {
    PkceChallenge p{};
    p.verifier = std::move(verifier);
    std::array<unsigned char, picosha2::k_digest_size> hash{};
    picosha2::hash256(p.verifier.begin(), p.verifier.end(), hash.begin(), hash.end());
    p.challenge = cppcodec::base64_url_unpadded::encode(hash.data(), hash.size());
    return p;
}

PkceChallenge GeneratePkceChallenge() {
    return PkceFromVerifier(random_verifier());
}

}

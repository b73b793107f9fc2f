#pragma once

#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <openssl/rand.h>

#include "../core/types.hpp"
#include "../core/errors.hpp"
#include "../core/hash.hpp"
#include "../core/seedable_rng.hpp"
#include "../crypto/rescue.hpp"

namespace semaphore {

inline PubKey derive_pub_key(const PrivKey& sk) {
    return PubKey{rescue::hash_key(sk.el)};
}

inline PrivKey keygen_from_seed(const uint8_t seed[32]) {
    auto rng = make_seeded_rng(seed);
    return PrivKey{rng.digest()};
}

// deterministic member keys for demos and tests: seed = SHA256(Dom::DEMO_KEY || label || index)
inline PrivKey keygen_from_label(const char* label, uint64_t index) {
    Sha256 h;
    h.init();
    h.update(Dom::DEMO_KEY, strlen(Dom::DEMO_KEY));
    h.update(label, strlen(label));
    sha256_acc_u64(h, index);
    uint8_t seed[32];
    h.finish(seed);
    return keygen_from_seed(seed);
}

// malformed hex or length is MALFORMED_KEY; a word >= p is NON_CANONICAL.
// The input is echoed in the message only when it is not secret.
inline Digest key_digest_from_hex(const std::string& hex, const char* what, bool secret) {
    std::string detail = secret ? std::string(what) + " (" + std::to_string(hex.size()) + " chars)"
                                : std::string(what) + " '" + hex + "'";
    auto raw = hex_decode(hex);
    if (!raw || raw->size() != 32)
        throw WitnessError(WitnessErrc::MALFORMED_KEY, detail);
    auto d = digest_from_bytes(raw->data(), raw->size());
    if (!d) throw WitnessError(WitnessErrc::NON_CANONICAL, detail);
    return *d;
}

inline PrivKey priv_key_from_hex(const std::string& hex) {
    return PrivKey{key_digest_from_hex(hex, "private key", true)};
}

inline PubKey pub_key_from_hex(const std::string& hex) {
    return PubKey{key_digest_from_hex(hex, "public key", false)};
}

inline void random_seed(uint8_t seed[32]) {
    if (RAND_bytes(seed, 32) != 1)
        throw std::runtime_error("RAND_bytes failed");
}

inline PrivKey keygen() {
    uint8_t seed[32];
    random_seed(seed);
    return keygen_from_seed(seed);
}

}

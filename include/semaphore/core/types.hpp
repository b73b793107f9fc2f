#pragma once

#include <cstdint>
#include <array>
#include <string>
#include <vector>
#include <optional>

#include "field.hpp"
#include "encoding.hpp"

namespace semaphore {

// (separations) every seed string below is baked into constants and proofs
namespace Dom {
    inline constexpr const char* ARK = "semaphore.dom.rescue.ark";
    inline constexpr const char* TRACE_COMMIT = "semaphore.dom.trace.commit";
    inline constexpr const char* COMPOSE = "semaphore.dom.compose";
    inline constexpr const char* DEMO_KEY = "semaphore.dom.demo.key";
}

inline constexpr size_t STATE_WIDTH = 12;
inline constexpr size_t CAPACITY_WIDTH = 4;
inline constexpr size_t RATE_WIDTH = 8;
inline constexpr size_t DIGEST_WIDTH = 4;
inline constexpr size_t NUM_ROUNDS = 7;
inline constexpr size_t CYCLE_LENGTH = NUM_ROUNDS + 1;

// alpha = 7, alpha * INV_ALPHA = 1 (mod p - 1)
inline constexpr uint64_t ALPHA = 7;
inline constexpr uint64_t INV_ALPHA = 10540996611094048183ULL;

using State = std::array<Fp, STATE_WIDTH>;
using Digest = std::array<Fp, DIGEST_WIDTH>;
using Capacity = std::array<Fp, CAPACITY_WIDTH>;

// the capacity a permutation starts from; never taken from input
enum class Domain : uint8_t {
    KEY_DERIVATION = 0,
    MERKLE = 1,
    NULLIFIER = 2,
    TOPIC = 3
};

inline Capacity domain_capacity(Domain d) {
    switch (d) {
        case Domain::KEY_DERIVATION: return {Fp{4}, Fp{0}, Fp{0}, Fp{0}};
        case Domain::MERKLE:         return {Fp{8}, Fp{0}, Fp{0}, Fp{0}};
        case Domain::NULLIFIER:      return {Fp{8}, Fp{1}, Fp{0}, Fp{0}};
        case Domain::TOPIC:          return {Fp{0}, Fp{2}, Fp{0}, Fp{0}};
    }
    return {Fp{0}, Fp{0}, Fp{0}, Fp{0}};
}

struct Params {
    // trees are padded to at least this depth
    size_t min_depth = 1;

    // fill the unused nullifier-lane cycles with random states instead of zeros
    bool randomize_padding = false;

    // let a backend that publishes the trace (TraceProofBackend) produce
    // proofs; such signals expose the signer's private key
    bool allow_transparent_proofs = false;

    // empty disables metrics output
    std::string metrics_path = "semaphore_metrics.csv";
};

inline Digest zero_digest() {
    return {fp_zero(), fp_zero(), fp_zero(), fp_zero()};
}

inline bool digest_eq(const Digest& a, const Digest& b) {
    for (size_t i = 0; i < DIGEST_WIDTH; i++)
        if (a[i] != b[i]) return false;
    return true;
}

inline std::array<uint8_t, 32> digest_to_bytes(const Digest& d) {
    std::array<uint8_t, 32> out;
    for (size_t i = 0; i < DIGEST_WIDTH; i++)
        put_u64_le(out.data() + i * 8, d[i].v);
    return out;
}

inline std::optional<Digest> digest_from_bytes(const uint8_t* in, size_t len) {
    if (len != 32) return std::nullopt;
    Digest d;
    for (size_t i = 0; i < DIGEST_WIDTH; i++) {
        uint64_t w = get_u64_le(in + i * 8);
        if (!fp_is_canonical(w)) return std::nullopt;
        d[i] = Fp{w};
    }
    return d;
}

inline std::string digest_to_hex(const Digest& d) {
    auto b = digest_to_bytes(d);
    return hex_encode(b.data(), b.size());
}

inline std::optional<Digest> digest_from_hex(const std::string& s) {
    auto raw = hex_decode(s);
    if (!raw) return std::nullopt;
    return digest_from_bytes(raw->data(), raw->size());
}

struct PrivKey {
    Digest el;

    static std::optional<PrivKey> parse(const std::string& hex) {
        auto d = digest_from_hex(hex);
        if (!d) return std::nullopt;
        return PrivKey{*d};
    }

    std::string to_hex() const { return digest_to_hex(el); }
};

struct PubKey {
    Digest el;

    static std::optional<PubKey> parse(const std::string& hex) {
        auto d = digest_from_hex(hex);
        if (!d) return std::nullopt;
        return PubKey{*d};
    }

    std::string to_hex() const { return digest_to_hex(el); }
};

inline size_t next_power_of_2(size_t n) {
    if (n == 0) return 1;
    n--;
    n |= n >> 1;
    n |= n >> 2;
    n |= n >> 4;
    n |= n >> 8;
    n |= n >> 16;
    n |= n >> 32;
    return n + 1;
}

inline size_t log2_size(size_t n) {
    size_t r = 0;
    while ((1ULL << r) < n) r++;
    return r;
}

}

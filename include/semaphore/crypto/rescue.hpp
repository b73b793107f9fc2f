#pragma once

#include <cstdint>
#include <cstring>
#include <array>
#include <string>
#include <vector>
#include <stdexcept>
#include <utility>

#include "../core/field.hpp"
#include "../core/types.hpp"
#include "../core/hash.hpp"

namespace semaphore {
namespace rescue {

// first row of the circulant MDS matrix
inline constexpr std::array<uint64_t, STATE_WIDTH> MDS_ROW = {
    7, 23, 8, 26, 13, 10, 9, 7, 6, 22, 21, 8
};

using Matrix = std::array<std::array<Fp, STATE_WIDTH>, STATE_WIDTH>;
using RoundConstants = std::array<State, NUM_ROUNDS>;

struct Tables {
    Matrix mds;
    Matrix inv_mds;
    RoundConstants ark1;
    RoundConstants ark2;
};

inline Matrix circulant_mds() {
    Matrix m;
    for (size_t i = 0; i < STATE_WIDTH; i++)
        for (size_t j = 0; j < STATE_WIDTH; j++)
            m[i][j] = Fp{MDS_ROW[(j + STATE_WIDTH - i) % STATE_WIDTH]};
    return m;
}

inline Matrix invert_matrix(Matrix a) {
    Matrix inv;
    for (size_t i = 0; i < STATE_WIDTH; i++)
        for (size_t j = 0; j < STATE_WIDTH; j++)
            inv[i][j] = fp_from_bool(i == j);

    for (size_t c = 0; c < STATE_WIDTH; c++) {
        size_t piv = c;
        while (piv < STATE_WIDTH && fp_is_zero(a[piv][c])) piv++;
        if (piv == STATE_WIDTH) throw std::logic_error("mds matrix is singular");
        std::swap(a[c], a[piv]);
        std::swap(inv[c], inv[piv]);

        Fp s = fp_inv(a[c][c]);
        for (size_t j = 0; j < STATE_WIDTH; j++) {
            a[c][j] = fp_mul(a[c][j], s);
            inv[c][j] = fp_mul(inv[c][j], s);
        }

        for (size_t r = 0; r < STATE_WIDTH; r++) {
            if (r == c || fp_is_zero(a[r][c])) continue;
            Fp f = a[r][c];
            for (size_t j = 0; j < STATE_WIDTH; j++) {
                a[r][j] = fp_sub(a[r][j], fp_mul(f, a[c][j]));
                inv[r][j] = fp_sub(inv[r][j], fp_mul(f, inv[c][j]));
            }
        }
    }
    return inv;
}

// ARK1 for all rounds, then ARK2, each constant 8 LE bytes of SHAKE256(Dom::ARK)
inline void derive_round_constants(RoundConstants& ark1, RoundConstants& ark2) {
    const size_t n = 2 * NUM_ROUNDS * STATE_WIDTH;
    std::vector<uint8_t> stream(n * 8);

    Shake256 xof;
    xof.init();
    xof.update(reinterpret_cast<const uint8_t*>(Dom::ARK), strlen(Dom::ARK));
    xof.finish(stream.data(), stream.size());

    size_t off = 0;
    for (auto* ark : {&ark1, &ark2}) {
        for (size_t r = 0; r < NUM_ROUNDS; r++) {
            for (size_t i = 0; i < STATE_WIDTH; i++) {
                (*ark)[r][i] = fp_from_u64(get_u64_le(stream.data() + off));
                off += 8;
            }
        }
    }
}

inline const Tables& tables() {
    static const Tables t = [] {
        Tables out;
        out.mds = circulant_mds();
        out.inv_mds = invert_matrix(out.mds);
        derive_round_constants(out.ark1, out.ark2);
        return out;
    }();
    return t;
}

inline void apply_sbox(State& s) {
    for (auto& x : s) x = fp_pow(x, ALPHA);
}

inline void apply_inv_sbox(State& s) {
    for (auto& x : s) x = fp_pow(x, INV_ALPHA);
}

inline void apply_matrix(const Matrix& m, State& s) {
    State out;
    for (size_t i = 0; i < STATE_WIDTH; i++) {
        Fp acc = fp_zero();
        for (size_t j = 0; j < STATE_WIDTH; j++)
            acc = fp_add(acc, fp_mul(m[i][j], s[j]));
        out[i] = acc;
    }
    s = out;
}

inline void apply_mds(State& s) { apply_matrix(tables().mds, s); }
inline void apply_inv_mds(State& s) { apply_matrix(tables().inv_mds, s); }

inline void add_constants(State& s, const State& c) {
    for (size_t i = 0; i < STATE_WIDTH; i++) s[i] = fp_add(s[i], c[i]);
}

inline void sub_constants(State& s, const State& c) {
    for (size_t i = 0; i < STATE_WIDTH; i++) s[i] = fp_sub(s[i], c[i]);
}

inline void apply_round(State& s, size_t round) {
    const auto& t = tables();
    apply_sbox(s);
    apply_mds(s);
    add_constants(s, t.ark1[round]);

    apply_inv_sbox(s);
    apply_mds(s);
    add_constants(s, t.ark2[round]);
}

inline void apply_inv_round(State& s, size_t round) {
    const auto& t = tables();
    sub_constants(s, t.ark2[round]);
    apply_inv_mds(s);
    apply_sbox(s);

    sub_constants(s, t.ark1[round]);
    apply_inv_mds(s);
    apply_inv_sbox(s);
}

inline void permute(State& s) {
    for (size_t r = 0; r < NUM_ROUNDS; r++) apply_round(s, r);
}

inline void inverse_permute(State& s) {
    for (size_t r = NUM_ROUNDS; r-- > 0;) apply_inv_round(s, r);
}

inline State init_state(Domain d, const Digest& lo, const Digest& hi) {
    State s;
    Capacity cap = domain_capacity(d);
    for (size_t i = 0; i < CAPACITY_WIDTH; i++) s[i] = cap[i];
    for (size_t i = 0; i < DIGEST_WIDTH; i++) {
        s[CAPACITY_WIDTH + i] = lo[i];
        s[CAPACITY_WIDTH + DIGEST_WIDTH + i] = hi[i];
    }
    return s;
}

inline Digest state_digest(const State& s) {
    return {s[CAPACITY_WIDTH], s[CAPACITY_WIDTH + 1], s[CAPACITY_WIDTH + 2], s[CAPACITY_WIDTH + 3]};
}

inline Digest merge_in_domain(Domain d, const Digest& lo, const Digest& hi) {
    State s = init_state(d, lo, hi);
    permute(s);
    return state_digest(s);
}

inline Digest merge(const Digest& left, const Digest& right) {
    return merge_in_domain(Domain::MERKLE, left, right);
}

inline Digest hash_key(const Digest& sk) {
    return merge_in_domain(Domain::KEY_DERIVATION, sk, zero_digest());
}

inline Digest nullifier(const Digest& sk, const Digest& topic_hash) {
    return merge_in_domain(Domain::NULLIFIER, sk, topic_hash);
}

// TOPIC capacity with capacity[0] = element count; a partial last block is
// padded with 1 then zeros
inline Digest hash_elements(const std::vector<Fp>& elements) {
    State s;
    s.fill(fp_zero());
    Capacity cap = domain_capacity(Domain::TOPIC);
    for (size_t i = 0; i < CAPACITY_WIDTH; i++) s[i] = cap[i];
    s[0] = Fp{(uint64_t)elements.size()};

    size_t i = 0;
    for (const auto& e : elements) {
        s[CAPACITY_WIDTH + i] = fp_add(s[CAPACITY_WIDTH + i], e);
        if (++i == RATE_WIDTH) {
            permute(s);
            i = 0;
        }
    }

    if (i > 0 || elements.empty()) {
        s[CAPACITY_WIDTH + i] = fp_add(s[CAPACITY_WIDTH + i], fp_one());
        permute(s);
    }
    return state_digest(s);
}

// 7 bytes per element after appending a 0x01 terminator, so every element is canonical
inline std::vector<Fp> pack_bytes(const uint8_t* data, size_t len) {
    std::vector<uint8_t> buf(data, data + len);
    buf.push_back(0x01);

    std::vector<Fp> out;
    out.reserve((buf.size() + 6) / 7);
    for (size_t off = 0; off < buf.size(); off += 7) {
        uint64_t w = 0;
        size_t n = buf.size() - off < 7 ? buf.size() - off : 7;
        for (size_t k = 0; k < n; k++) w |= (uint64_t)buf[off + k] << (k * 8);
        out.push_back(Fp{w});
    }
    return out;
}

inline Digest hash_bytes(const uint8_t* data, size_t len) {
    return hash_elements(pack_bytes(data, len));
}

inline Digest hash_bytes(const std::string& s) {
    return hash_bytes(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

}
}

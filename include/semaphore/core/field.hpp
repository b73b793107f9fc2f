#pragma once

#include <cstdint>
#include <vector>

namespace semaphore {

// Goldilocks field, p = 2^64 - 2^32 + 1
inline constexpr uint64_t P = 0xFFFFFFFF00000001ULL;
inline constexpr uint64_t EPSILON = 0xFFFFFFFFULL;

struct Fp {
    uint64_t v;
};

inline constexpr Fp fp_zero() { return Fp{0}; }
inline constexpr Fp fp_one() { return Fp{1}; }

inline Fp fp_from_u64(uint64_t x) {
    return Fp{x >= P ? x - P : x};
}

inline bool fp_is_canonical(uint64_t x) {
    return x < P;
}

inline bool fp_eq(const Fp& a, const Fp& b) { return a.v == b.v; }
inline bool fp_is_zero(const Fp& a) { return a.v == 0; }

inline bool operator==(const Fp& a, const Fp& b) { return a.v == b.v; }
inline bool operator!=(const Fp& a, const Fp& b) { return a.v != b.v; }

inline Fp fp_add(const Fp& a, const Fp& b) {
    uint64_t s = a.v + b.v;
    bool carry = s < a.v;
    if (carry || s >= P) s -= P;
    return Fp{s};
}

inline Fp fp_sub(const Fp& a, const Fp& b) {
    uint64_t d = a.v - b.v;
    if (a.v < b.v) d += P;
    return Fp{d};
}

inline Fp fp_neg(const Fp& a) {
    return a.v == 0 ? a : Fp{P - a.v};
}

// 2^64 = EPSILON and 2^96 = -1 (mod p)
inline uint64_t reduce128(__uint128_t x) {
    uint64_t lo = (uint64_t)x;
    uint64_t hi = (uint64_t)(x >> 64);
    uint64_t hi_hi = hi >> 32;
    uint64_t hi_lo = hi & EPSILON;

    uint64_t t0 = lo - hi_hi;
    if (lo < hi_hi) t0 -= EPSILON;

    uint64_t t1 = hi_lo * EPSILON;
    uint64_t t2 = t0 + t1;
    if (t2 < t1) t2 += EPSILON;

    if (t2 >= P) t2 -= P;
    return t2;
}

inline Fp fp_mul(const Fp& a, const Fp& b) {
    return Fp{reduce128((__uint128_t)a.v * b.v)};
}

inline Fp fp_sqr(const Fp& a) { return fp_mul(a, a); }

inline Fp fp_pow(Fp base, uint64_t e) {
    Fp r = fp_one();
    while (e) {
        if (e & 1) r = fp_mul(r, base);
        base = fp_sqr(base);
        e >>= 1;
    }
    return r;
}

inline Fp fp_inv(const Fp& a) {
    return fp_pow(a, P - 2);
}

inline Fp fp_from_bool(bool b) { return Fp{b ? 1ULL : 0ULL}; }

namespace field {

struct Op {
    static std::vector<Fp> zeros(size_t n) {
        return std::vector<Fp>(n, fp_zero());
    }

    static Fp inner(const std::vector<Fp>& a, const std::vector<Fp>& b) {
        Fp acc = fp_zero();
        size_t n = a.size() < b.size() ? a.size() : b.size();
        for (size_t i = 0; i < n; i++)
            acc = fp_add(acc, fp_mul(a[i], b[i]));
        return acc;
    }
};

}

}

#pragma once

#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <openssl/evp.h>

#include "field.hpp"
#include "types.hpp"

namespace semaphore {

// AES-256-CTR keystream over a 32-byte seed
class AesCtr256 {
    EVP_CIPHER_CTX* ctx_ = nullptr;
    uint8_t buf_[64];
    size_t pos_ = sizeof(buf_);

    void refill() {
        static const uint8_t zeros[sizeof(buf_)] = {0};
        int outlen = 0;
        if (EVP_EncryptUpdate(ctx_, buf_, &outlen, zeros, (int)sizeof(buf_)) != 1 ||
            outlen != (int)sizeof(buf_))
            throw std::runtime_error("aes-ctr keystream failed");
        pos_ = 0;
    }

public:
    AesCtr256() = default;
    AesCtr256(const AesCtr256&) = delete;
    AesCtr256& operator=(const AesCtr256&) = delete;
    AesCtr256(AesCtr256&& o) noexcept : ctx_(o.ctx_), pos_(o.pos_) {
        memcpy(buf_, o.buf_, sizeof(buf_));
        o.ctx_ = nullptr;
    }
    ~AesCtr256() { if (ctx_) EVP_CIPHER_CTX_free(ctx_); }

    void init(const uint8_t key[32], uint64_t stream) {
        if (ctx_) EVP_CIPHER_CTX_free(ctx_);
        ctx_ = EVP_CIPHER_CTX_new();
        if (!ctx_) throw std::runtime_error("EVP_CIPHER_CTX_new failed");
        uint8_t iv[16] = {0};
        put_u64_le(iv, stream);
        if (EVP_EncryptInit_ex(ctx_, EVP_aes_256_ctr(), nullptr, key, iv) != 1)
            throw std::runtime_error("aes-ctr init failed");
        pos_ = sizeof(buf_);
    }

    uint64_t next_u64() {
        if (pos_ + 8 > sizeof(buf_)) refill();
        uint64_t v = get_u64_le(buf_ + pos_);
        pos_ += 8;
        return v;
    }

    uint64_t bounded(uint64_t M) {
        if (M == 0) return 0;
        uint64_t limit = UINT64_MAX - (UINT64_MAX % M);
        for (;;) {
            uint64_t x = next_u64();
            if (x < limit) return x % M;
        }
    }
};

struct SeedableRng {
    AesCtr256 prg;

    void init(const uint8_t seed[32]) {
        prg.init(seed, 0);
    }

    uint64_t u64() { return prg.next_u64(); }

    uint64_t bounded(uint64_t M) { return prg.bounded(M); }

    Fp fp() {
        for (;;) {
            uint64_t x = u64();
            if (fp_is_canonical(x)) return Fp{x};
        }
    }

    Digest digest() { return {fp(), fp(), fp(), fp()}; }
};

inline SeedableRng make_seeded_rng(const uint8_t seed[32]) {
    SeedableRng rng;
    rng.init(seed);
    return rng;
}

}

#pragma once

#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <openssl/evp.h>

namespace semaphore {

class Sha256 {
    EVP_MD_CTX* ctx_ = nullptr;

public:
    Sha256() : ctx_(EVP_MD_CTX_new()) {
        if (!ctx_) throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;
    ~Sha256() { EVP_MD_CTX_free(ctx_); }

    void init() {
        if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1)
            throw std::runtime_error("sha256 init failed");
    }

    void update(const uint8_t* data, size_t len) {
        if (len == 0) return;
        if (EVP_DigestUpdate(ctx_, data, len) != 1)
            throw std::runtime_error("sha256 update failed");
    }

    void update(const char* s, size_t len) {
        update(reinterpret_cast<const uint8_t*>(s), len);
    }

    void finish(uint8_t out[32]) {
        unsigned int n = 0;
        if (EVP_DigestFinal_ex(ctx_, out, &n) != 1 || n != 32)
            throw std::runtime_error("sha256 finish failed");
    }
};

inline void sha256_acc_u64(Sha256& h, uint64_t v) {
    uint8_t b[8];
    for (int i = 0; i < 8; i++) b[i] = (uint8_t)(v >> (i * 8));
    h.update(b, 8);
}

// extendable output; used to expand seed strings into field constants
class Shake256 {
    EVP_MD_CTX* ctx_ = nullptr;

public:
    Shake256() : ctx_(EVP_MD_CTX_new()) {
        if (!ctx_) throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    Shake256(const Shake256&) = delete;
    Shake256& operator=(const Shake256&) = delete;
    ~Shake256() { EVP_MD_CTX_free(ctx_); }

    void init() {
        if (EVP_DigestInit_ex(ctx_, EVP_shake256(), nullptr) != 1)
            throw std::runtime_error("shake256 init failed");
    }

    void update(const uint8_t* data, size_t len) {
        if (len == 0) return;
        if (EVP_DigestUpdate(ctx_, data, len) != 1)
            throw std::runtime_error("shake256 update failed");
    }

    void finish(uint8_t* out, size_t out_len) {
        if (EVP_DigestFinalXOF(ctx_, out, out_len) != 1)
            throw std::runtime_error("shake256 finish failed");
    }
};

}

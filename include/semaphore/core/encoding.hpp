#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <optional>

namespace semaphore {

inline std::string hex_encode(const uint8_t* data, size_t len) {
    static const char H[] = "0123456789abcdef";
    std::string r(len * 2, 0);
    for (size_t i = 0; i < len; i++) {
        r[i * 2] = H[data[i] >> 4];
        r[i * 2 + 1] = H[data[i] & 0xF];
    }
    return r;
}

inline std::string hex_encode(const std::vector<uint8_t>& data) {
    return hex_encode(data.data(), data.size());
}

inline std::optional<std::vector<uint8_t>> hex_decode(const std::string& s) {
    auto nib = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return 10 + c - 'a';
        if (c >= 'A' && c <= 'F') return 10 + c - 'A';
        return -1;
    };
    if (s.size() % 2 != 0) return std::nullopt;
    std::vector<uint8_t> r(s.size() / 2);
    for (size_t i = 0; i < r.size(); i++) {
        int hi = nib(s[i * 2]);
        int lo = nib(s[i * 2 + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        r[i] = (uint8_t)((hi << 4) | lo);
    }
    return r;
}

inline void put_u64_le(uint8_t* out, uint64_t v) {
    for (int i = 0; i < 8; i++) out[i] = (uint8_t)(v >> (i * 8));
}

inline uint64_t get_u64_le(const uint8_t* in) {
    uint64_t v = 0;
    for (int i = 0; i < 8; i++) v |= (uint64_t)in[i] << (i * 8);
    return v;
}

inline void put_u32_le(uint8_t* out, uint32_t v) {
    for (int i = 0; i < 4; i++) out[i] = (uint8_t)(v >> (i * 8));
}

inline uint32_t get_u32_le(const uint8_t* in) {
    uint32_t v = 0;
    for (int i = 0; i < 4; i++) v |= (uint32_t)in[i] << (i * 8);
    return v;
}

}

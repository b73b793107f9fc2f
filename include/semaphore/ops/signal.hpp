#pragma once

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>
#include <sstream>
#include <optional>

#include "../core/types.hpp"
#include "../core/encoding.hpp"
#include "backend.hpp"

namespace semaphore {

struct Signal {
    std::string topic;
    Digest nullifier;
    Digest root;
    Proof proof;

    std::string to_string() const {
        std::ostringstream os;
        os << "topic:      " << topic << "\n"
           << "nullifier:  " << digest_to_hex(nullifier) << "\n"
           << "root:       " << digest_to_hex(root) << "\n"
           << "proof size: " << proof.size() / 1024 << " KB";
        return os.str();
    }

    // topic_len u32 | topic | nullifier[32] | root[32] | proof_len u32 | proof
    std::vector<uint8_t> to_bytes() const {
        std::vector<uint8_t> out(4 + topic.size() + 64 + 4 + proof.size());
        uint8_t* p = out.data();
        put_u32_le(p, (uint32_t)topic.size());
        p += 4;
        memcpy(p, topic.data(), topic.size());
        p += topic.size();
        auto n = digest_to_bytes(nullifier);
        memcpy(p, n.data(), 32);
        p += 32;
        auto r = digest_to_bytes(root);
        memcpy(p, r.data(), 32);
        p += 32;
        put_u32_le(p, (uint32_t)proof.size());
        p += 4;
        if (!proof.empty()) memcpy(p, proof.bytes.data(), proof.size());
        return out;
    }

    static std::optional<Signal> from_bytes(const uint8_t* data, size_t len) {
        size_t off = 0;
        auto take = [&](size_t n) -> const uint8_t* {
            if (len - off < n) return nullptr;
            const uint8_t* p = data + off;
            off += n;
            return p;
        };

        const uint8_t* p = take(4);
        if (!p) return std::nullopt;
        size_t topic_len = get_u32_le(p);
        const uint8_t* t = take(topic_len);
        if (!t) return std::nullopt;

        const uint8_t* n = take(32);
        const uint8_t* r = take(32);
        if (!n || !r) return std::nullopt;
        auto nullifier = digest_from_bytes(n, 32);
        auto root = digest_from_bytes(r, 32);
        if (!nullifier || !root) return std::nullopt;

        p = take(4);
        if (!p) return std::nullopt;
        size_t proof_len = get_u32_le(p);
        const uint8_t* pr = take(proof_len);
        if (!pr || off != len) return std::nullopt;

        Signal s;
        s.topic.assign(reinterpret_cast<const char*>(t), topic_len);
        s.nullifier = *nullifier;
        s.root = *root;
        s.proof.bytes.assign(pr, pr + proof_len);
        return s;
    }
};

}

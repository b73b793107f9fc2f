#pragma once

#include <cstdint>
#include <cstring>
#include <array>
#include <set>
#include <mutex>
#include <string>

#include "../core/types.hpp"
#include "../crypto/rescue.hpp"
#include "access_set.hpp"
#include "backend.hpp"
#include "signal.hpp"

namespace semaphore {

enum class SignalStatus : uint8_t {
    ACCEPTED,
    INVALID_PROOF,
    REPLAYED
};

inline const char* signal_status_name(SignalStatus s) {
    switch (s) {
        case SignalStatus::ACCEPTED:      return "accepted";
        case SignalStatus::INVALID_PROOF: return "invalid proof";
        case SignalStatus::REPLAYED:      return "replayed";
    }
    return "unknown";
}

// Nullifiers already spent, per topic. Safe to share between threads.
class NullifierRegistry {
    using Key = std::array<uint8_t, 64>;

    mutable std::mutex mu_;
    std::set<Key> seen_;

    static Key make_key(const Digest& topic_hash, const Digest& nullifier) {
        Key k;
        auto t = digest_to_bytes(topic_hash);
        auto n = digest_to_bytes(nullifier);
        memcpy(k.data(), t.data(), 32);
        memcpy(k.data() + 32, n.data(), 32);
        return k;
    }

public:
    bool seen(const Digest& topic_hash, const Digest& nullifier) const {
        std::lock_guard<std::mutex> lock(mu_);
        return seen_.count(make_key(topic_hash, nullifier)) != 0;
    }

    // true if the pair was new
    bool record(const Digest& topic_hash, const Digest& nullifier) {
        std::lock_guard<std::mutex> lock(mu_);
        return seen_.insert(make_key(topic_hash, nullifier)).second;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mu_);
        return seen_.size();
    }
};

// verify, then spend the nullifier; a second valid signal on the same topic is a replay
inline SignalStatus accept_signal(const AccessSet& set, NullifierRegistry& registry,
                                  const std::string& topic, const Signal& sig,
                                  const ProofBackend& backend) {
    if (!set.verify_signal(topic, sig, backend)) return SignalStatus::INVALID_PROOF;
    if (!registry.record(rescue::hash_bytes(topic), sig.nullifier)) return SignalStatus::REPLAYED;
    return SignalStatus::ACCEPTED;
}

}

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <optional>
#include <utility>

#include "../core/types.hpp"
#include "../core/errors.hpp"
#include "../crypto/rescue.hpp"
#include "../crypto/merkle.hpp"
#include "../air/semaphore_air.hpp"
#include "../utils/metrics.hpp"
#include "backend.hpp"
#include "keys.hpp"
#include "prover.hpp"
#include "signal.hpp"

namespace semaphore {

// Ordered member keys committed to by one Merkle root.
class AccessSet {
    std::vector<PubKey> members_;
    MerkleTree tree_;
    Params prm_;

public:
    AccessSet(std::vector<PubKey> members, Params prm = Params{})
        : members_(std::move(members)), prm_(std::move(prm)) {
        std::vector<Digest> leaves;
        leaves.reserve(members_.size());
        for (const auto& pk : members_) leaves.push_back(pk.el);
        tree_ = MerkleTree(leaves, prm_.min_depth);
    }

    static AccessSet build(const std::vector<PubKey>& members, const Params& prm = Params{}) {
        return AccessSet(members, prm);
    }

    const Digest& root() const { return tree_.root(); }
    size_t size() const { return members_.size(); }
    size_t depth() const { return tree_.depth(); }
    const Params& params() const { return prm_; }
    const std::vector<PubKey>& members() const { return members_; }

    MerklePath path_for(size_t index) const {
        if (index >= members_.size())
            throw WitnessError(WitnessErrc::INVALID_INDEX,
                               "member " + std::to_string(index) + " of " + std::to_string(members_.size()));
        return tree_.prove(index);
    }

    std::optional<size_t> index_of(const PubKey& pk) const {
        for (size_t i = 0; i < members_.size(); i++)
            if (digest_eq(members_[i].el, pk.el)) return i;
        return std::nullopt;
    }

    Signal make_signal(const PrivKey& sk, const std::string& topic,
                       const ProofBackend& backend,
                       const uint8_t* padding_seed = nullptr) const {
        Stopwatch sw;

        auto index = index_of(derive_pub_key(sk));
        if (!index) throw WitnessError(WitnessErrc::UNKNOWN_KEY, "derived public key");

        Digest topic_hash = rescue::hash_bytes(topic);
        MerklePath path = path_for(*index);

        SemaphoreProver prover(depth(), prm_);
        TraceTable trace = prover.build_trace(sk, path, *index, topic_hash, padding_seed);
        air::SemaphoreAir air(depth(), prover.public_inputs(trace, topic_hash));

        Signal sig;
        sig.topic = topic;
        sig.nullifier = air.public_inputs().nullifier;
        sig.root = air.public_inputs().root;
        sig.proof = prover.prove(air, trace, backend);

        dump_metrics(prm_.metrics_path, "prove", air, sw.elapsed_ms(), sig.proof.size());
        return sig;
    }

    // false on any mismatch; never says which check failed
    bool verify_signal(const std::string& topic, const Signal& sig,
                       const ProofBackend& backend) const {
        Stopwatch sw;

        if (sig.topic != topic) return false;
        if (!digest_eq(sig.root, root())) return false;

        air::PublicInputs pub;
        pub.root = sig.root;
        pub.topic_hash = rescue::hash_bytes(topic);
        pub.nullifier = sig.nullifier;

        air::SemaphoreAir air(depth(), pub);
        bool ok = backend.verify(air, sig.proof);

        dump_metrics(prm_.metrics_path, ok ? "verify" : "verify_reject", air, sw.elapsed_ms(), sig.proof.size());
        return ok;
    }
};

}

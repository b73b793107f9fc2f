#pragma once

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>
#include <utility>

#include "../core/types.hpp"
#include "../core/errors.hpp"
#include "../core/seedable_rng.hpp"
#include "../crypto/rescue.hpp"
#include "../crypto/merkle.hpp"
#include "../air/layout.hpp"
#include "../air/semaphore_air.hpp"
#include "backend.hpp"
#include "keys.hpp"

namespace semaphore {

namespace detail {

inline void check_canonical(const Digest& d, const char* what) {
    for (const auto& x : d)
        if (!fp_is_canonical(x.v))
            throw WitnessError(WitnessErrc::NON_CANONICAL, what);
}

inline void write_row(TraceTable& t, size_t row, const State& merkle, const State& nul, bool bit) {
    t.set_lane(row, col::MERKLE, merkle);
    t.set_lane(row, col::NULLIFIER, nul);
    t.at(row, col::INDEX_BIT) = fp_from_bool(bit);
}

}

class SemaphoreProver {
    size_t depth_;
    Params prm_;

public:
    explicit SemaphoreProver(size_t depth, Params prm = Params{})
        : depth_(depth), prm_(std::move(prm)) {}

    size_t depth() const { return depth_; }

    void validate_witness(const PrivKey& sk, const MerklePath& path, size_t leaf_index,
                          const Digest& topic_hash) const {
        if (path.size() != depth_)
            throw WitnessError(WitnessErrc::WITNESS_LENGTH_MISMATCH,
                               "path has " + std::to_string(path.size()) +
                               " levels, tree depth is " + std::to_string(depth_));
        if (depth_ < 64 && leaf_index >= ((size_t)1 << depth_))
            throw WitnessError(WitnessErrc::INDEX_OUT_OF_RANGE, "leaf " + std::to_string(leaf_index));
        if (path_index(path) != leaf_index)
            throw WitnessError(WitnessErrc::PATH_INDEX_MISMATCH, "leaf " + std::to_string(leaf_index));

        detail::check_canonical(sk.el, "private key");
        detail::check_canonical(topic_hash, "topic hash");
        for (const auto& node : path) detail::check_canonical(node.sibling, "sibling");
    }

    // padding_seed only matters with Params::randomize_padding; null draws a fresh seed
    TraceTable build_trace(const PrivKey& sk, const MerklePath& path, size_t leaf_index,
                           const Digest& topic_hash, const uint8_t* padding_seed = nullptr) const {
        validate_witness(sk, path, leaf_index, topic_hash);

        SeedableRng rng;
        if (prm_.randomize_padding) {
            uint8_t seed[32];
            if (padding_seed) memcpy(seed, padding_seed, 32);
            else random_seed(seed);
            rng.init(seed);
        }

        const size_t length = trace_length_for_depth(depth_);
        TraceTable trace(TRACE_WIDTH, length);

        State merkle = rescue::init_state(Domain::KEY_DERIVATION, sk.el, zero_digest());
        State nul = rescue::init_state(Domain::NULLIFIER, sk.el, topic_hash);
        bool bit = false;

        for (size_t cycle = 0; cycle * CYCLE_LENGTH < length; cycle++) {
            if (cycle > 0) {
                Digest acc = rescue::state_digest(merkle);
                if (cycle <= depth_) {
                    const PathNode& node = path[cycle - 1];
                    bit = node.bit;
                    merkle = bit ? rescue::init_state(Domain::MERKLE, node.sibling, acc)
                                 : rescue::init_state(Domain::MERKLE, acc, node.sibling);
                } else {
                    bit = false;
                    merkle = rescue::init_state(Domain::MERKLE, acc, zero_digest());
                }

                if (prm_.randomize_padding) {
                    for (auto& x : nul) x = rng.fp();
                } else {
                    nul.fill(fp_zero());
                }
            }

            size_t row = cycle * CYCLE_LENGTH;
            detail::write_row(trace, row, merkle, nul, bit);
            for (size_t r = 0; r < NUM_ROUNDS; r++) {
                rescue::apply_round(merkle, r);
                rescue::apply_round(nul, r);
                detail::write_row(trace, row + r + 1, merkle, nul, bit);
            }
        }
        return trace;
    }

    // public inputs an honest trace commits to
    air::PublicInputs public_inputs(const TraceTable& trace, const Digest& topic_hash) const {
        air::PublicInputs pub;
        size_t root_row = root_row_for_depth(depth_);
        for (size_t j = 0; j < DIGEST_WIDTH; j++) {
            pub.root[j] = trace.at(root_row, col::MERKLE_LO + j);
            pub.nullifier[j] = trace.at(CYCLE_LENGTH - 1, col::NULLIFIER_LO + j);
        }
        pub.topic_hash = topic_hash;
        return pub;
    }

    // refuses to hand a trace the AIR rejects to the backend, and refuses a
    // backend that would publish the witness unless the caller opted in
    Proof prove(const air::SemaphoreAir& air, const TraceTable& trace, const ProofBackend& backend) const {
        if (backend.reveals_witness() && !prm_.allow_transparent_proofs)
            throw TransparentBackendError();
        if (auto slot = air.find_violation(trace)) {
            std::string label = *slot < air.num_constraints() ? air.registry()[*slot].label : "trace shape";
            throw ConstraintViolation(*slot, label);
        }
        return backend.prove(air, trace);
    }
};

}

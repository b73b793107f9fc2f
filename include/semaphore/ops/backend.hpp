#pragma once

#include <cstdint>
#include <cstring>
#include <array>
#include <vector>

#include "../core/types.hpp"
#include "../core/hash.hpp"
#include "../core/encoding.hpp"
#include "../air/layout.hpp"
#include "../air/semaphore_air.hpp"

namespace semaphore {

struct Proof {
    std::vector<uint8_t> bytes;

    size_t size() const { return bytes.size(); }
    bool empty() const { return bytes.empty(); }
};

// Seam to a proving system. A backend commits to the trace on prove() and
// accepts on verify() iff every constraint of the AIR vanishes on what was
// committed; it never reports which constraint failed.
class ProofBackend {
public:
    virtual ~ProofBackend() = default;
    virtual Proof prove(const air::SemaphoreAir& air, const TraceTable& trace) const = 0;
    virtual bool verify(const air::SemaphoreAir& air, const Proof& proof) const = 0;

    // true if proofs carry witness cells, the private key among them
    virtual bool reveals_witness() const = 0;
};

// Reference backend: the proof carries the whole trace plus a SHA-256
// commitment over it. Not succinct and not zero-knowledge: row 0 holds the
// signer's private key, so provers refuse it unless
// Params::allow_transparent_proofs is set.
//
//   "SMPH" | version u8 | length u32 | width u32 | commitment[32] | cells u64 (row-major)
class TraceProofBackend : public ProofBackend {
public:
    static constexpr uint8_t VERSION = 1;
    static constexpr size_t HEADER_SIZE = 4 + 1 + 4 + 4 + 32;

    static void commit(const air::PublicInputs& pub, size_t length, size_t width,
                       const uint8_t* cells, size_t cells_len, uint8_t out[32]) {
        Sha256 h;
        h.init();
        h.update(Dom::TRACE_COMMIT, strlen(Dom::TRACE_COMMIT));
        for (const Digest* d : {&pub.root, &pub.topic_hash, &pub.nullifier}) {
            auto b = digest_to_bytes(*d);
            h.update(b.data(), b.size());
        }
        sha256_acc_u64(h, length);
        sha256_acc_u64(h, width);
        h.update(cells, cells_len);
        h.finish(out);
    }

    // per-slot folding coefficients drawn from the commitment
    static std::vector<Fp> composition_coeffs(const uint8_t commitment[32], size_t n) {
        std::vector<Fp> coeffs;
        coeffs.reserve(n);
        uint64_t ctr = 0;
        while (coeffs.size() < n) {
            Sha256 h;
            h.init();
            h.update(Dom::COMPOSE, strlen(Dom::COMPOSE));
            h.update(commitment, 32);
            sha256_acc_u64(h, ctr++);
            uint8_t out[32];
            h.finish(out);
            for (size_t k = 0; k < 4 && coeffs.size() < n; k++) {
                uint64_t w = get_u64_le(out + k * 8);
                if (fp_is_canonical(w) && w != 0) coeffs.push_back(Fp{w});
            }
        }
        return coeffs;
    }

    Proof prove(const air::SemaphoreAir& air, const TraceTable& trace) const override {
        const size_t cells_len = trace.cells().size() * 8;
        Proof proof;
        proof.bytes.resize(HEADER_SIZE + cells_len);
        uint8_t* p = proof.bytes.data();

        memcpy(p, "SMPH", 4);
        p[4] = VERSION;
        put_u32_le(p + 5, (uint32_t)trace.length());
        put_u32_le(p + 9, (uint32_t)trace.width());

        uint8_t* cells = p + HEADER_SIZE;
        for (size_t i = 0; i < trace.cells().size(); i++)
            put_u64_le(cells + i * 8, trace.cells()[i].v);

        commit(air.public_inputs(), trace.length(), trace.width(), cells, cells_len, p + 13);
        return proof;
    }

    bool reveals_witness() const override { return true; }

    bool verify(const air::SemaphoreAir& air, const Proof& proof) const override {
        const auto& b = proof.bytes;
        if (b.size() < HEADER_SIZE) return false;
        if (memcmp(b.data(), "SMPH", 4) != 0 || b[4] != VERSION) return false;

        size_t length = get_u32_le(b.data() + 5);
        size_t width = get_u32_le(b.data() + 9);
        if (length != air.trace_length() || width != air.trace_width()) return false;
        if (b.size() != HEADER_SIZE + length * width * 8) return false;

        const uint8_t* cells = b.data() + HEADER_SIZE;
        uint8_t expect[32];
        commit(air.public_inputs(), length, width, cells, length * width * 8, expect);
        if (memcmp(expect, b.data() + 13, 32) != 0) return false;

        TraceTable trace(width, length);
        for (size_t r = 0; r < length; r++) {
            for (size_t c = 0; c < width; c++) {
                uint64_t w = get_u64_le(cells + (r * width + c) * 8);
                if (!fp_is_canonical(w)) return false;
                trace.at(r, c) = Fp{w};
            }
        }

        auto coeffs = composition_coeffs(expect, air.num_constraints());
        for (size_t r = 0; r < length; r++) {
            if (!fp_is_zero(air::fold_constraints(air.evaluate_row(trace, r), coeffs)))
                return false;
        }
        return true;
    }
};

}

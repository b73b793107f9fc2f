#pragma once

#include <cstdint>
#include <array>
#include <string>
#include <vector>
#include <optional>

#include "../core/field.hpp"
#include "../core/types.hpp"
#include "../crypto/rescue.hpp"
#include "constraints.hpp"
#include "layout.hpp"

namespace semaphore {
namespace air {

struct PublicInputs {
    Digest root;
    Digest topic_hash;
    Digest nullifier;
};

struct PeriodicValues {
    // 1 on the seven round rows of a cycle, 0 on the cycle's last row
    Fp hash_mask;
    // 1 on row 0 of the trace only
    Fp first_row;
    State ark1;
    State ark2;
};

using LaneSlots = std::array<ConstraintId, STATE_WIDTH>;
using WordSlots = std::array<ConstraintId, DIGEST_WIDTH>;

inline LaneSlots emit_rescue_round(ConstraintRegistry& reg, size_t lane, const char* name) {
    LaneSlots ids;
    for (size_t i = 0; i < STATE_WIDTH; i++)
        ids[i] = reg.emit(ConstraintKind::TRANSITION, (uint32_t)ALPHA,
                          std::string(name) + ".round[" + std::to_string(i) + "]", {lane + i});
    return ids;
}

inline void emit_word_assertions(ConstraintRegistry& reg, std::vector<Assertion>& out,
                                 const char* name, size_t column, size_t first_row, size_t stride,
                                 const Fp* values, size_t n) {
    for (size_t i = 0; i < n; i++) {
        ConstraintId id = reg.emit(ConstraintKind::BOUNDARY, 1,
                                   std::string(name) + "[" + std::to_string(i) + "]", {column + i});
        out.push_back({id, column + i, first_row, stride, values[i]});
    }
}

class SemaphoreAir {
    size_t depth_;
    size_t trace_length_;
    PublicInputs pub_;

    ConstraintRegistry registry_;
    std::vector<Assertion> assertions_;

    LaneSlots merkle_round_;
    LaneSlots nullifier_round_;
    ConstraintId bit_boolean_;
    ConstraintId bit_constant_;
    WordSlots select_left_;
    WordSlots select_right_;
    WordSlots key_binding_;

    void emit_transitions() {
        merkle_round_ = emit_rescue_round(registry_, col::MERKLE, "merkle");
        nullifier_round_ = emit_rescue_round(registry_, col::NULLIFIER, "nullifier");

        bit_boolean_ = registry_.emit(ConstraintKind::TRANSITION, 2, "index_bit.boolean", {col::INDEX_BIT});
        bit_constant_ = registry_.emit(ConstraintKind::TRANSITION, 1, "index_bit.constant", {col::INDEX_BIT});

        for (size_t j = 0; j < DIGEST_WIDTH; j++) {
            select_left_[j] = registry_.emit(
                ConstraintKind::TRANSITION, 2, "merkle.select_left[" + std::to_string(j) + "]",
                {col::INDEX_BIT, col::MERKLE_LO + j});
            select_right_[j] = registry_.emit(
                ConstraintKind::TRANSITION, 2, "merkle.select_right[" + std::to_string(j) + "]",
                {col::INDEX_BIT, col::MERKLE_LO + j, col::MERKLE_HI + j});
        }

        // nullifier input cells == cells the member's public key is derived from
        for (size_t j = 0; j < DIGEST_WIDTH; j++)
            key_binding_[j] = registry_.emit(
                ConstraintKind::TRANSITION, 1, "nullifier.key_binding[" + std::to_string(j) + "]",
                {col::NULLIFIER_LO + j, col::MERKLE_LO + j});
    }

    void emit_assertions() {
        Capacity key_cap = domain_capacity(Domain::KEY_DERIVATION);
        Capacity merkle_cap = domain_capacity(Domain::MERKLE);
        Capacity null_cap = domain_capacity(Domain::NULLIFIER);
        Digest zero = zero_digest();

        emit_word_assertions(registry_, assertions_, "merkle.key_capacity",
                             col::MERKLE_CAP, 0, 0, key_cap.data(), CAPACITY_WIDTH);
        emit_word_assertions(registry_, assertions_, "merkle.key_padding",
                             col::MERKLE_HI, 0, 0, zero.data(), DIGEST_WIDTH);
        emit_word_assertions(registry_, assertions_, "merkle.capacity",
                             col::MERKLE_CAP, CYCLE_LENGTH, CYCLE_LENGTH, merkle_cap.data(), CAPACITY_WIDTH);
        emit_word_assertions(registry_, assertions_, "nullifier.capacity",
                             col::NULLIFIER_CAP, 0, 0, null_cap.data(), CAPACITY_WIDTH);
        emit_word_assertions(registry_, assertions_, "nullifier.topic",
                             col::TOPIC, 0, 0, pub_.topic_hash.data(), DIGEST_WIDTH);
        emit_word_assertions(registry_, assertions_, "merkle.root",
                             col::MERKLE_LO, root_row_for_depth(depth_), 0, pub_.root.data(), DIGEST_WIDTH);
        emit_word_assertions(registry_, assertions_, "nullifier.output",
                             col::NULLIFIER_LO, CYCLE_LENGTH - 1, 0, pub_.nullifier.data(), DIGEST_WIDTH);
    }

    static void eval_round(const Fp* cur, const Fp* next, const PeriodicValues& pv,
                           const LaneSlots& slots, std::vector<Fp>& result) {
        State step1, step2;
        for (size_t i = 0; i < STATE_WIDTH; i++) {
            step1[i] = cur[i];
            step2[i] = next[i];
        }

        rescue::apply_sbox(step1);
        rescue::apply_mds(step1);
        rescue::add_constants(step1, pv.ark1);

        // next = MDS * sbox^-1(step1) + ARK2  <=>  sbox(MDS^-1 * (next - ARK2)) = step1
        rescue::sub_constants(step2, pv.ark2);
        rescue::apply_inv_mds(step2);
        rescue::apply_sbox(step2);

        for (size_t i = 0; i < STATE_WIDTH; i++)
            result[slots[i].slot] = fp_mul(pv.hash_mask, fp_sub(step2[i], step1[i]));
    }

public:
    SemaphoreAir(size_t depth, const PublicInputs& pub)
        : depth_(depth), trace_length_(trace_length_for_depth(depth)), pub_(pub) {
        emit_transitions();
        emit_assertions();
    }

    size_t depth() const { return depth_; }
    size_t trace_width() const { return TRACE_WIDTH; }
    size_t trace_length() const { return trace_length_; }
    const PublicInputs& public_inputs() const { return pub_; }

    const ConstraintRegistry& registry() const { return registry_; }
    const std::vector<Assertion>& assertions() const { return assertions_; }
    size_t num_constraints() const { return registry_.size(); }

    PeriodicValues periodic_values(size_t row) const {
        const auto& t = rescue::tables();
        PeriodicValues pv;
        size_t step = row % CYCLE_LENGTH;
        pv.first_row = fp_from_bool(row == 0);
        if (step < NUM_ROUNDS) {
            pv.hash_mask = fp_one();
            pv.ark1 = t.ark1[step];
            pv.ark2 = t.ark2[step];
        } else {
            pv.hash_mask = fp_zero();
            pv.ark1.fill(fp_zero());
            pv.ark2.fill(fp_zero());
        }
        return pv;
    }

    // writes every transition slot of result; boundary slots are left untouched
    void evaluate_transition(const EvaluationFrame& frame, const PeriodicValues& pv,
                             std::vector<Fp>& result) const {
        const Fp* cur = frame.current;
        const Fp* next = frame.next;

        eval_round(cur + col::MERKLE, next + col::MERKLE, pv, merkle_round_, result);
        eval_round(cur + col::NULLIFIER, next + col::NULLIFIER, pv, nullifier_round_, result);

        Fp b = cur[col::INDEX_BIT];
        Fp b_next = next[col::INDEX_BIT];
        result[bit_boolean_.slot] = fp_sub(fp_sqr(b), b);
        result[bit_constant_.slot] = fp_mul(pv.hash_mask, fp_sub(b_next, b));

        // at a cycle boundary the carried digest must enter the rate on the side b' selects
        Fp boundary = fp_sub(fp_one(), pv.hash_mask);
        Fp keep_left = fp_mul(boundary, fp_sub(fp_one(), b_next));
        Fp keep_right = fp_mul(boundary, b_next);
        for (size_t j = 0; j < DIGEST_WIDTH; j++) {
            Fp acc = cur[col::MERKLE_LO + j];
            result[select_left_[j].slot] = fp_mul(keep_left, fp_sub(next[col::MERKLE_LO + j], acc));
            result[select_right_[j].slot] = fp_mul(keep_right, fp_sub(next[col::MERKLE_HI + j], acc));
        }

        for (size_t j = 0; j < DIGEST_WIDTH; j++)
            result[key_binding_[j].slot] =
                fp_mul(pv.first_row, fp_sub(cur[col::NULLIFIER_LO + j], cur[col::MERKLE_LO + j]));
    }

    void evaluate_boundary(const TraceTable& trace, size_t row, std::vector<Fp>& result) const {
        for (const auto& a : assertions_)
            result[a.id.slot] = a.applies_to(row) ? fp_sub(trace.at(row, a.column), a.value) : fp_zero();
    }

    // slot-indexed constraint values at one row; the last row has no transition
    std::vector<Fp> evaluate_row(const TraceTable& trace, size_t row) const {
        std::vector<Fp> result(registry_.size(), fp_zero());
        if (row + 1 < trace.length()) {
            EvaluationFrame frame{trace.row(row), trace.row(row + 1)};
            evaluate_transition(frame, periodic_values(row), result);
        }
        evaluate_boundary(trace, row, result);
        return result;
    }

    bool shape_matches(const TraceTable& trace) const {
        return trace.width() == TRACE_WIDTH && trace.length() == trace_length_;
    }

    // first failing slot, or num_constraints() when the trace has the wrong shape.
    // Diagnostic only; verifiers expose verify().
    std::optional<size_t> find_violation(const TraceTable& trace) const {
        if (!shape_matches(trace)) return registry_.size();
        for (size_t row = 0; row < trace.length(); row++) {
            auto values = evaluate_row(trace, row);
            for (size_t s = 0; s < values.size(); s++)
                if (!fp_is_zero(values[s])) return s;
        }
        return std::nullopt;
    }

    bool verify(const TraceTable& trace) const {
        return !find_violation(trace).has_value();
    }
};

}
}

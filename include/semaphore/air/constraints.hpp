#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <utility>

#include "../core/field.hpp"

namespace semaphore {
namespace air {

enum class ConstraintKind : uint8_t {
    TRANSITION,
    BOUNDARY
};

struct ConstraintId {
    size_t slot;
};

struct ConstraintInfo {
    ConstraintKind kind;
    size_t slot;
    // degree in trace columns, periodic selectors excluded
    uint32_t degree;
    std::string label;
    std::vector<size_t> columns;
};

// Slots are handed out by emit() only. Every routine that defines a
// constraint takes the same registry, so two checks can never fold into
// one slot of the composition.
class ConstraintRegistry {
    std::vector<ConstraintInfo> info_;

public:
    ConstraintRegistry() = default;

    ConstraintId emit(ConstraintKind kind, uint32_t degree, std::string label,
                      std::vector<size_t> columns) {
        size_t slot = info_.size();
        info_.push_back({kind, slot, degree, std::move(label), std::move(columns)});
        return ConstraintId{slot};
    }

    size_t size() const { return info_.size(); }
    const ConstraintInfo& operator[](size_t slot) const { return info_[slot]; }
    const std::vector<ConstraintInfo>& constraints() const { return info_; }

    size_t count(ConstraintKind kind) const {
        size_t n = 0;
        for (const auto& c : info_)
            if (c.kind == kind) n++;
        return n;
    }

    uint32_t max_degree(ConstraintKind kind) const {
        uint32_t d = 0;
        for (const auto& c : info_)
            if (c.kind == kind && c.degree > d) d = c.degree;
        return d;
    }
};

// trace[first_row + k * stride][column] == value; stride 0 pins one row
struct Assertion {
    ConstraintId id;
    size_t column;
    size_t first_row;
    size_t stride;
    Fp value;

    bool applies_to(size_t row) const {
        if (row < first_row) return false;
        if (stride == 0) return row == first_row;
        return (row - first_row) % stride == 0;
    }
};

struct EvaluationFrame {
    const Fp* current;
    const Fp* next;
};

// random linear combination over slots; evaluations and coeffs are slot indexed
inline Fp fold_constraints(const std::vector<Fp>& evaluations, const std::vector<Fp>& coeffs) {
    Fp acc = fp_zero();
    for (size_t i = 0; i < evaluations.size() && i < coeffs.size(); i++)
        acc = fp_add(acc, fp_mul(coeffs[i], evaluations[i]));
    return acc;
}

}
}

#pragma once

#include <cstdint>
#include <vector>
#include <ostream>
#include <iomanip>
#include <stdexcept>

#include "../core/field.hpp"
#include "../core/types.hpp"

namespace semaphore {

// Trace columns. Each lane is a full permutation state: capacity then rate.
//
// | 0..3   | Merkle lane capacity                                    |
// | 4..7   | Merkle lane rate lo: private key (cycle 0), digest out  |
// | 8..11  | Merkle lane rate hi: carried node / sibling operand     |
// | 12..15 | nullifier lane capacity                                 |
// | 16..19 | nullifier lane rate lo: private key in, nullifier out   |
// | 20..23 | nullifier lane rate hi: topic hash                      |
// | 24     | Merkle index bit of the current level                   |
namespace col {
    inline constexpr size_t MERKLE = 0;
    inline constexpr size_t MERKLE_CAP = 0;
    inline constexpr size_t MERKLE_LO = 4;
    inline constexpr size_t MERKLE_HI = 8;
    inline constexpr size_t NULLIFIER = 12;
    inline constexpr size_t NULLIFIER_CAP = 12;
    inline constexpr size_t NULLIFIER_LO = 16;
    inline constexpr size_t TOPIC = 20;
    inline constexpr size_t INDEX_BIT = 24;
}

inline constexpr size_t TRACE_WIDTH = 25;

// one key-derivation cycle, one cycle per level, padded to a power of two
inline size_t trace_length_for_depth(size_t depth) {
    return next_power_of_2(CYCLE_LENGTH * (depth + 1));
}

inline size_t root_row_for_depth(size_t depth) {
    return CYCLE_LENGTH * (depth + 1) - 1;
}

class TraceTable {
    size_t width_ = 0;
    size_t length_ = 0;
    std::vector<Fp> cells_;

public:
    TraceTable() = default;

    TraceTable(size_t width, size_t length)
        : width_(width), length_(length), cells_(width * length, fp_zero()) {}

    size_t width() const { return width_; }
    size_t length() const { return length_; }

    const Fp& at(size_t row, size_t column) const { return cells_[row * width_ + column]; }
    Fp& at(size_t row, size_t column) { return cells_[row * width_ + column]; }

    void set(size_t column, size_t row, const Fp& v) { at(row, column) = v; }
    const Fp& get(size_t column, size_t row) const { return at(row, column); }

    const Fp* row(size_t r) const { return cells_.data() + r * width_; }
    Fp* row(size_t r) { return cells_.data() + r * width_; }

    void update_row(size_t r, const std::vector<Fp>& values) {
        if (values.size() != width_) throw std::invalid_argument("row width mismatch");
        for (size_t c = 0; c < width_; c++) at(r, c) = values[c];
    }

    State lane(size_t r, size_t first_column) const {
        State s;
        for (size_t i = 0; i < STATE_WIDTH; i++) s[i] = at(r, first_column + i);
        return s;
    }

    void set_lane(size_t r, size_t first_column, const State& s) {
        for (size_t i = 0; i < STATE_WIDTH; i++) at(r, first_column + i) = s[i];
    }

    const std::vector<Fp>& cells() const { return cells_; }
};

// rows [first, last) of the listed column range, one line per row
inline void print_trace(std::ostream& os, const TraceTable& t, size_t first_row, size_t last_row,
                        size_t first_col, size_t last_col) {
    if (last_row > t.length()) last_row = t.length();
    if (last_col > t.width()) last_col = t.width();
    for (size_t r = first_row; r < last_row; r++) {
        os << std::setw(4) << r << " |";
        for (size_t c = first_col; c < last_col; c++)
            os << ' ' << std::hex << std::setw(16) << std::setfill('0') << t.at(r, c).v
               << std::dec << std::setfill(' ');
        os << '\n';
    }
}

}

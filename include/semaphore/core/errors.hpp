#pragma once

#include <cstdint>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace semaphore {

enum class WitnessErrc : uint8_t {
    INVALID_INDEX,
    WITNESS_LENGTH_MISMATCH,
    INDEX_OUT_OF_RANGE,
    PATH_INDEX_MISMATCH,
    MALFORMED_KEY,
    NON_CANONICAL,
    UNKNOWN_KEY
};

inline const char* witness_errc_name(WitnessErrc c) {
    switch (c) {
        case WitnessErrc::INVALID_INDEX:           return "invalid index";
        case WitnessErrc::WITNESS_LENGTH_MISMATCH: return "witness length mismatch";
        case WitnessErrc::INDEX_OUT_OF_RANGE:      return "index out of range";
        case WitnessErrc::PATH_INDEX_MISMATCH:     return "path does not match index";
        case WitnessErrc::MALFORMED_KEY:           return "malformed key";
        case WitnessErrc::NON_CANONICAL:           return "non-canonical field element";
        case WitnessErrc::UNKNOWN_KEY:             return "key not in access set";
    }
    return "witness error";
}

class WitnessError : public std::invalid_argument {
    WitnessErrc code_;

public:
    WitnessError(WitnessErrc code, const std::string& detail)
        : std::invalid_argument(std::string(witness_errc_name(code)) + ": " + detail),
          code_(code) {}

    WitnessErrc code() const { return code_; }
};

// a valid witness produced a trace the AIR rejects; never emit a proof for it
class ConstraintViolation : public std::logic_error {
    size_t slot_;

public:
    ConstraintViolation(size_t slot, const std::string& label)
        : std::logic_error("constraint " + std::to_string(slot) + " (" + label + ") violated"),
          slot_(slot) {}

    size_t slot() const { return slot_; }
};

// the backend would publish the witness and the caller did not opt in
class TransparentBackendError : public std::logic_error {
public:
    TransparentBackendError()
        : std::logic_error("proof backend reveals the witness; "
                           "set Params::allow_transparent_proofs to use it") {}
};

}

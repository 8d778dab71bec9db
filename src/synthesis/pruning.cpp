/// @file pruning.cpp
/// @brief Degenerate-combination rules for the level generator

#include "synthesis/pruning.hpp"

#include <algorithm>

namespace gatesynth {

PruningPolicy::PruningPolicy(const GateLibrary& library, size_t num_rows, bool enabled)
    : library_(&library),
      zero_(BitVector::constant(num_rows, false)),
      one_(BitVector::constant(num_rows, true)),
      enabled_(enabled) {}

bool PruningPolicy::has_smaller_gate(GateType function, size_t min_arity, int below,
                                     size_t step) const {
    for (auto arity = static_cast<int>(min_arity); arity < below; arity += static_cast<int>(step)) {
        if (library_->has_gate(function, arity)) {
            return true;
        }
    }
    return false;
}

bool PruningPolicy::should_skip(const GateDescriptor& gate, const std::vector<SignalId>& inputs,
                                const SignalPool& pool) const {
    if (!enabled_) {
        return false;
    }
    if (gate.function == GateType::BUFFER) {
        return true;
    }
    if (inputs.size() < 2) {
        return false;
    }

    // Equal ids are adjacent in a non-decreasing combination.
    size_t distinct = 0;
    size_t odd = 0;
    for (size_t i = 0; i < inputs.size();) {
        size_t run = 1;
        while (i + run < inputs.size() && inputs[i + run] == inputs[i]) {
            run++;
        }
        distinct++;
        if (run % 2 == 1) {
            odd++;
        }
        i += run;
    }
    if (distinct == inputs.size()) {
        return false;
    }

    if (is_idempotent(gate.function)) {
        if (distinct == 1 && (gate.function == GateType::AND || gate.function == GateType::OR)) {
            return true;
        }
        return has_smaller_gate(gate.function, std::max<size_t>(distinct, 2), gate.arity, 1);
    }

    if (is_parity(gate.function)) {
        if (odd == 0) {
            return pool.contains(gate.function == GateType::XOR ? zero_ : one_);
        }
        if (odd == 1 && gate.function == GateType::XOR) {
            return true;
        }
        size_t min_arity = odd;
        while (min_arity < 2) {
            min_arity += 2;
        }
        return has_smaller_gate(gate.function, min_arity, gate.arity, 2);
    }

    return false;
}

} // namespace gatesynth

#pragma once

/// @file pruning.hpp
/// @brief Sound pre-filter for gate applications that cannot yield a new signal

#include "synthesis/bit_vector.hpp"
#include "synthesis/gate_library.hpp"
#include "synthesis/signal.hpp"
#include "synthesis/signal_pool.hpp"

#include <cstddef>
#include <vector>

namespace gatesynth {

/// Decides, before evaluation, whether a gate application over a combination
/// of pool signals can be skipped.
///
/// A combination is skipped only when its result is guaranteed to be in the
/// pool by the end of the current level anyway:
///   - BUFFER(x), AND/OR over a single distinct input: the input itself.
///   - AND/NAND/OR/NOR with repeated inputs: equal to the same family over
///     the distinct inputs, skipped when the library has that family at a
///     smaller arity that can hold them.
///   - XOR/XNOR with repeated inputs: pairs cancel. XOR over one remaining
///     input is that input; no remaining input gives a constant, skipped once
///     the constant is in the pool; otherwise skipped when the library has
///     the family at a smaller arity of the same parity.
/// NAND(x, x) and NOR(x, x) are never skipped: they may be the only source
/// of NOT x.
class PruningPolicy {
  public:
    PruningPolicy(const GateLibrary& library, size_t num_rows, bool enabled = true);

    /// @param inputs Combination in non-decreasing id order
    [[nodiscard]] bool should_skip(const GateDescriptor& gate, const std::vector<SignalId>& inputs,
                                   const SignalPool& pool) const;

    [[nodiscard]] bool enabled() const { return enabled_; }

  private:
    /// Whether the library holds `function` at some arity j with
    /// min_arity <= j < below and (j - min_arity) % step == 0
    [[nodiscard]] bool has_smaller_gate(GateType function, size_t min_arity, int below,
                                        size_t step) const;

    const GateLibrary* library_;
    BitVector zero_;
    BitVector one_;
    bool enabled_;
};

} // namespace gatesynth

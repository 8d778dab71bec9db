#pragma once

/// @file signal.hpp
/// @brief Signal node: a distinct boolean function of the inputs plus its provenance

#include "synthesis/bit_vector.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace gatesynth {

/// Dense index of a signal inside its pool (creation order)
using SignalId = uint32_t;

/// How a signal was produced: either a primary input (leaf) or one gate
/// application over earlier signals (derived).
struct Origin {
    std::string input_name;       ///< Leaf only
    std::optional<size_t> gate;   ///< Derived only: index into the gate library
    std::vector<SignalId> inputs; ///< Derived only: ordered, non-owning references

    [[nodiscard]] bool is_leaf() const { return !gate.has_value(); }

    [[nodiscard]] static Origin leaf(std::string name) {
        Origin origin;
        origin.input_name = std::move(name);
        return origin;
    }

    [[nodiscard]] static Origin derived(size_t gate_index, std::vector<SignalId> inputs) {
        Origin origin;
        origin.gate = gate_index;
        origin.inputs = std::move(inputs);
        return origin;
    }

    bool operator==(const Origin& other) const {
        return input_name == other.input_name && gate == other.gate && inputs == other.inputs;
    }
    bool operator!=(const Origin& other) const { return !(*this == other); }
};

/// A node of the search DAG. Immutable once it is in a pool.
struct Signal {
    SignalId id = 0;
    BitVector bits;
    Origin origin;
    int level = 0;         ///< Generation pass that first produced it (0 for leaves)
    double own_cost = 0.0; ///< Cost of this signal's own gate (0 for leaves)
};

} // namespace gatesynth

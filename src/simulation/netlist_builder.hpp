#pragma once

/// @file netlist_builder.hpp
/// @brief Materializes found signals as gate/wire circuits

#include "simulation/circuit.hpp"
#include "synthesis/signal.hpp"
#include "synthesis/signal_pool.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gatesynth {

/// One primary output of a materialized netlist
struct NetlistOutput {
    std::string name;
    Origin origin;                  ///< Derivation producing the output
    std::optional<SignalId> signal; ///< Set when the derivation is a pool signal's own origin
};

/// Builds a finalized circuit realizing the given outputs.
///
/// Primary inputs are the pool's leaves, in pool order, named after their
/// variables. Every pool signal reachable from an output becomes exactly one
/// gate, so shared sub-circuits appear once. An output derivation that is not
/// a pool signal gets a gate of its own (identical derivations share it).
/// Gates carry the library cell name and cost.
/// @throws std::out_of_range if an output references an unknown signal
[[nodiscard]] std::unique_ptr<Circuit> build_netlist(const SignalPool& pool,
                                                     const std::vector<NetlistOutput>& outputs);

/// Single-output convenience: the cone of one pool signal
[[nodiscard]] std::unique_ptr<Circuit> build_netlist(const SignalPool& pool, SignalId signal,
                                                     const std::string& output_name = "Out");

/// The leaf columns of the pool, in primary-input order of build_netlist()
[[nodiscard]] std::vector<BitVector> leaf_columns(const SignalPool& pool);

} // namespace gatesynth

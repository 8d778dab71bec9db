#pragma once

/// @file report.hpp
/// @brief Human-readable rendering of found signals and netlists

#include "simulation/circuit.hpp"
#include "synthesis/signal.hpp"
#include "synthesis/signal_pool.hpp"

#include <string>

namespace gatesynth {

/// Renders a pool signal as a nested gate expression: leaves by name,
/// derived signals as "XOR2(A, B)".
/// @throws std::out_of_range for an unknown id
[[nodiscard]] std::string render_expression(const SignalPool& pool, SignalId signal);

/// Same rendering for a derivation that may not be a pool signal itself
[[nodiscard]] std::string render_expression(const SignalPool& pool, const Origin& origin);

/// One line per gate in topological order ("n3 = NAND2(A, n1)"), then one
/// line per primary output ("Sum = n3").
/// @throws std::runtime_error if the circuit is not finalized
[[nodiscard]] std::string render_netlist(const Circuit& circuit);

/// "3 gates, cost 4.5, depth 2"
[[nodiscard]] std::string netlist_summary(const Circuit& circuit);

/// Formats a cost without trailing zeros ("5", "2.5")
[[nodiscard]] std::string format_cost(double cost);

} // namespace gatesynth

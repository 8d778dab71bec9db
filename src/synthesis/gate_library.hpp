#pragma once

/// @file gate_library.hpp
/// @brief Immutable table of primitive gates available to the search

#include "simulation/gate.hpp"
#include "synthesis/bit_vector.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gatesynth {

/// Largest gate arity the search accepts
constexpr int MAX_GATE_ARITY = 4;

/// One primitive gate: a logic family applied to a fixed number of inputs,
/// under a library name such as "NAND2", at a scalar cost.
struct GateDescriptor {
    std::string name;
    GateType function = GateType::AND;
    int arity = 2;
    double cost = 1.0;
};

/// Builds a descriptor from a cell name: "NOT", "BUF", "<FAMILY><arity>"
/// ("AND3", "xnor2"), or a bare family name for the two-input form.
/// @throws ConfigurationError for an unknown family or a malformed arity
[[nodiscard]] GateDescriptor make_gate(std::string_view name, double cost);

/// Evaluates a gate word-parallel over whole columns.
/// @throws std::invalid_argument if the input count does not match the arity
///         or the columns differ in length
[[nodiscard]] BitVector evaluate_gate(const GateDescriptor& gate,
                                      const std::vector<const BitVector*>& inputs);

/// An ordered, validated, immutable collection of gate descriptors.
///
/// The order is significant: the level generator visits gates in this order,
/// which fixes the discovery order (and therefore tie-breaking) of a search.
class GateLibrary {
  public:
    /// @throws ConfigurationError if the library is empty, a name repeats,
    ///         an arity is outside 1..4 or illegal for its family, or a cost
    ///         is negative or not finite
    explicit GateLibrary(std::vector<GateDescriptor> gates);

    [[nodiscard]] size_t size() const { return gates_.size(); }
    [[nodiscard]] const GateDescriptor& operator[](size_t index) const { return gates_[index]; }
    [[nodiscard]] const GateDescriptor& at(size_t index) const { return gates_.at(index); }
    [[nodiscard]] std::vector<GateDescriptor>::const_iterator begin() const { return gates_.begin(); }
    [[nodiscard]] std::vector<GateDescriptor>::const_iterator end() const { return gates_.end(); }

    /// Index of the gate with this name (case-insensitive)
    [[nodiscard]] std::optional<size_t> find(std::string_view name) const;

    /// Whether some gate of the given family has exactly this arity
    [[nodiscard]] bool has_gate(GateType function, int arity) const;

    [[nodiscard]] int max_arity() const { return max_arity_; }

  private:
    std::vector<GateDescriptor> gates_;
    int max_arity_ = 0;
};

/// Every built-in cell (NOT, AND2-4, OR2-4, NAND2-4, NOR2-4, XOR2, XNOR2),
/// all at the same cost
[[nodiscard]] GateLibrary standard_gate_library(double cost = 1.0);

} // namespace gatesynth

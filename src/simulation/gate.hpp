#pragma once

/// @file gate.hpp
/// @brief Logic gate model — gate families, evaluation, and the Gate class

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gatesynth {

class Wire; // Forward declaration

/// Logic functions a gate can compute. Every family is symmetric in its
/// arguments, so input order never changes the result.
enum class GateType { NOT, BUFFER, AND, NAND, OR, NOR, XOR, XNOR };

/// Returns the human-readable name of a gate type
[[nodiscard]] constexpr std::string_view gate_type_name(GateType type) {
    switch (type) {
    case GateType::NOT:
        return "NOT";
    case GateType::BUFFER:
        return "BUFFER";
    case GateType::AND:
        return "AND";
    case GateType::NAND:
        return "NAND";
    case GateType::OR:
        return "OR";
    case GateType::NOR:
        return "NOR";
    case GateType::XOR:
        return "XOR";
    case GateType::XNOR:
        return "XNOR";
    }
    return "UNKNOWN";
}

/// Parses a family name ("AND", "nand", "BUF", ...). Case-insensitive.
[[nodiscard]] std::optional<GateType> parse_gate_type(std::string_view name);

/// True for the single-input families (NOT, BUFFER)
[[nodiscard]] constexpr bool is_unary(GateType type) {
    return type == GateType::NOT || type == GateType::BUFFER;
}

/// True when the output is the complement of the base function
/// (NOT, NAND, NOR, XNOR)
[[nodiscard]] constexpr bool is_inverting(GateType type) {
    return type == GateType::NOT || type == GateType::NAND || type == GateType::NOR ||
           type == GateType::XNOR;
}

/// True for families where repeating an input does not change the result
/// (AND, NAND, OR, NOR)
[[nodiscard]] constexpr bool is_idempotent(GateType type) {
    return type == GateType::AND || type == GateType::NAND || type == GateType::OR ||
           type == GateType::NOR;
}

/// True for XOR and XNOR, where a pair of equal inputs cancels out
[[nodiscard]] constexpr bool is_parity(GateType type) {
    return type == GateType::XOR || type == GateType::XNOR;
}

/// Evaluates a logic gate for one row of input values.
/// This is a pure function with no side effects.
/// @throws std::invalid_argument if the input count is wrong for the gate type
[[nodiscard]] bool evaluate(GateType type, const std::vector<bool>& inputs);

/// Evaluates a logic gate on 64 rows at once (one bit per row).
/// @throws std::invalid_argument if the input count is wrong for the gate type
[[nodiscard]] uint64_t evaluate_word(GateType type, const std::vector<uint64_t>& inputs);

/// Represents a single gate instance in a materialized netlist.
///
/// A gate has a logic family, the library name it was instantiated from
/// (e.g. "NAND2"), its cost, a set of input wires, and a single output wire.
class Gate {
  public:
    /// Construct a gate with a unique ID and type
    explicit Gate(uint32_t id, GateType type);

    [[nodiscard]] uint32_t get_id() const { return id_; }
    [[nodiscard]] GateType get_type() const { return type_; }
    [[nodiscard]] bool get_state() const { return state_; }
    [[nodiscard]] Wire* get_output() const { return output_; }
    [[nodiscard]] const std::vector<Wire*>& get_inputs() const { return inputs_; }
    [[nodiscard]] const std::string& get_cell_name() const { return cell_name_; }
    [[nodiscard]] double get_cost() const { return cost_; }

    void set_state(bool state) { state_ = state; }
    void set_output(Wire* wire) { output_ = wire; }

    /// Records which library cell this gate instantiates
    void set_cell(std::string name, double cost) {
        cell_name_ = std::move(name);
        cost_ = cost;
    }

    /// Appends a wire to this gate's input list
    void add_input(Wire* wire);

  private:
    uint32_t id_;
    GateType type_;
    std::vector<Wire*> inputs_;
    Wire* output_ = nullptr;
    std::string cell_name_;
    double cost_ = 0.0;
    bool state_ = false;
};

} // namespace gatesynth

#pragma once

/// @file expression.hpp
/// @brief Circuit expressions such as "XOR(A, NAND(B, C))" and their truth tables

#include "synthesis/gate_library.hpp"
#include "synthesis/input_set.hpp"

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace gatesynth {

/// Parsed expression tree
struct Expression {
    enum class Kind { Variable, Constant, Gate };

    Kind kind = Kind::Constant;
    std::string name;            ///< Variable name, or gate cell name ("NAND2")
    bool value = false;          ///< Constant only
    GateDescriptor gate;         ///< Gate only (cost unused)
    std::vector<Expression> args; ///< Gate only
};

/// Parses `GATE(arg, ...)` calls over identifiers and the literals 0 and 1.
/// Gate names follow make_gate(): "NAND3", "xor2", or a bare family name for
/// the two-input form ("NOT" is unary).
/// @throws ConfigurationError on syntax errors, unknown gates, or an
///         argument count that does not match the gate's arity
[[nodiscard]] Expression parse_expression(std::string_view text);

/// Sorted, unique variable names used by the expression
[[nodiscard]] std::vector<std::string> extract_variables(const Expression& expression);

/// Evaluates the expression on every row of the input set.
/// @throws ConfigurationError if it uses a variable the input set lacks
[[nodiscard]] BitVector evaluate_expression(const Expression& expression, const InputSet& inputs);

/// Renders the expression back to text with canonical gate names
[[nodiscard]] std::string to_string(const Expression& expression);

/// Contents of a circuit description file
struct CircuitFile {
    /// "NO OUTPUTS" mode: only the listed inputs are generated
    bool inputs_only = false;
    std::vector<std::string> variables; ///< Inputs-only mode: variables from the second line

    struct Output {
        std::string name;
        Expression expression;
    };
    std::vector<Output> outputs;
};

/// Parses one expression per non-blank line, `Name : expr` or bare `expr`
/// (named Output, or Output1..N when there are several), ignoring a
/// trailing `[complexity=N]` annotation. A first line of `NO OUTPUTS`
/// selects inputs-only mode with the variable names on the second line.
/// @throws ConfigurationError on malformed content
[[nodiscard]] CircuitFile parse_circuit_file(std::istream& in, const std::string& source);

/// @throws std::runtime_error if the file cannot be opened
[[nodiscard]] CircuitFile load_circuit_file(const std::string& path);

/// Input and output tables generated from a circuit file
struct GeneratedTables {
    InputSet inputs;
    std::vector<NamedColumn> outputs;
};

/// Builds the canonical input table over the sorted variables of all
/// outputs (or the listed variables in inputs-only mode) and evaluates
/// every output on it.
/// @throws ConfigurationError if there are no variables or too many
[[nodiscard]] GeneratedTables generate_tables(const CircuitFile& file);

} // namespace gatesynth

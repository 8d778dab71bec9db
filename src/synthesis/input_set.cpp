/// @file input_set.cpp
/// @brief Boundary validation of input and target tables

#include "synthesis/input_set.hpp"

#include "synthesis/errors.hpp"

#include <unordered_set>
#include <utility>

namespace gatesynth {

InputSet::InputSet(std::vector<NamedColumn> columns) : columns_(std::move(columns)) {
    if (columns_.empty()) {
        throw ConfigurationError("At least one input variable is required");
    }
    if (columns_.size() > MAX_INPUT_VARIABLES) {
        throw ConfigurationError("At most " + std::to_string(MAX_INPUT_VARIABLES) +
                                 " input variables are supported, got " +
                                 std::to_string(columns_.size()));
    }

    std::unordered_set<std::string> names;
    size_t rows = num_rows();
    for (const NamedColumn& column : columns_) {
        if (column.name.empty()) {
            throw ConfigurationError("Input variable names must not be empty");
        }
        if (!names.insert(column.name).second) {
            throw ConfigurationError("Input variable '" + column.name + "' appears more than once");
        }
        if (column.bits.size() != rows) {
            throw ConfigurationError("Input '" + column.name + "' has " +
                                     std::to_string(column.bits.size()) + " rows; " +
                                     std::to_string(columns_.size()) + " variables need " +
                                     std::to_string(rows));
        }
    }
}

InputSet InputSet::canonical(size_t num_vars, std::vector<std::string> names) {
    if (num_vars == 0 || num_vars > MAX_INPUT_VARIABLES) {
        throw ConfigurationError("Number of input variables must be between 1 and " +
                                 std::to_string(MAX_INPUT_VARIABLES));
    }
    if (names.empty()) {
        for (size_t i = 0; i < num_vars; i++) {
            names.push_back(std::string(1, static_cast<char>('A' + i)));
        }
    }
    if (names.size() != num_vars) {
        throw ConfigurationError("Expected " + std::to_string(num_vars) + " variable names, got " +
                                 std::to_string(names.size()));
    }

    std::vector<NamedColumn> columns;
    for (size_t i = 0; i < num_vars; i++) {
        columns.push_back({std::move(names[i]), input_column(num_vars, i)});
    }
    return InputSet(std::move(columns));
}

void InputSet::check_target(const std::string& name, const BitVector& bits) const {
    if (bits.size() != num_rows()) {
        throw ConfigurationError("Target '" + name + "' has " + std::to_string(bits.size()) +
                                 " rows; " + std::to_string(num_vars()) + " input variables need " +
                                 std::to_string(num_rows()));
    }
}

void InputSet::check_targets(const std::vector<NamedColumn>& targets) const {
    if (targets.empty()) {
        throw ConfigurationError("At least one target output is required");
    }
    std::unordered_set<std::string> names;
    for (const NamedColumn& target : targets) {
        if (target.name.empty()) {
            throw ConfigurationError("Target output names must not be empty");
        }
        if (!names.insert(target.name).second) {
            throw ConfigurationError("Target output '" + target.name + "' appears more than once");
        }
        check_target(target.name, target.bits);
    }
}

} // namespace gatesynth

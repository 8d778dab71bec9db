/// @file gate_library.cpp
/// @brief Gate descriptor parsing, validation and column evaluation

#include "synthesis/gate_library.hpp"

#include "common/text_utils.hpp"
#include "synthesis/errors.hpp"

#include <cctype>
#include <cmath>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>

namespace gatesynth {

GateDescriptor make_gate(std::string_view name, double cost) {
    std::string upper = to_upper(name);

    size_t digits_begin = upper.size();
    while (digits_begin > 0 && std::isdigit(static_cast<unsigned char>(upper[digits_begin - 1]))) {
        digits_begin--;
    }

    std::string family = upper.substr(0, digits_begin);
    std::string digits = upper.substr(digits_begin);

    auto type = parse_gate_type(family);
    if (!type) {
        throw ConfigurationError("Unknown gate '" + std::string(name) + "'");
    }

    int arity = is_unary(*type) ? 1 : 2;
    if (!digits.empty()) {
        if (digits.size() > 2) {
            throw ConfigurationError("Malformed arity in gate name '" + std::string(name) + "'");
        }
        arity = std::stoi(digits);
    }

    GateDescriptor gate;
    gate.name = upper;
    gate.function = *type;
    gate.arity = arity;
    gate.cost = cost;
    return gate;
}

BitVector evaluate_gate(const GateDescriptor& gate, const std::vector<const BitVector*>& inputs) {
    if (inputs.empty() || static_cast<int>(inputs.size()) != gate.arity) {
        throw std::invalid_argument("Gate " + gate.name + " expects " + std::to_string(gate.arity) +
                                    " inputs, got " + std::to_string(inputs.size()));
    }
    size_t rows = inputs.front()->size();
    for (const BitVector* column : inputs) {
        if (column->size() != rows) {
            throw std::invalid_argument("Gate inputs must have equal length");
        }
    }

    BitVector result(rows);
    std::vector<uint64_t> words(inputs.size());
    for (size_t w = 0; w < result.num_words(); w++) {
        for (size_t i = 0; i < inputs.size(); i++) {
            words[i] = inputs[i]->word(w);
        }
        result.set_word(w, evaluate_word(gate.function, words));
    }
    return result;
}

GateLibrary::GateLibrary(std::vector<GateDescriptor> gates) : gates_(std::move(gates)) {
    if (gates_.empty()) {
        throw ConfigurationError("Gate library is empty");
    }

    std::unordered_set<std::string> names;
    for (const GateDescriptor& gate : gates_) {
        if (gate.name.empty()) {
            throw ConfigurationError("Gate library entry has an empty name");
        }
        if (!names.insert(to_upper(gate.name)).second) {
            throw ConfigurationError("Gate '" + gate.name + "' appears more than once");
        }
        if (gate.arity < 1 || gate.arity > MAX_GATE_ARITY) {
            throw ConfigurationError("Gate '" + gate.name + "' has arity " +
                                     std::to_string(gate.arity) + "; supported arities are 1 to " +
                                     std::to_string(MAX_GATE_ARITY));
        }
        if (is_unary(gate.function) != (gate.arity == 1)) {
            throw ConfigurationError("Gate '" + gate.name + "' has arity " +
                                     std::to_string(gate.arity) + ", which is illegal for " +
                                     std::string(gate_type_name(gate.function)));
        }
        if (!std::isfinite(gate.cost) || gate.cost < 0.0) {
            throw ConfigurationError("Gate '" + gate.name + "' must have a finite, non-negative cost");
        }
        if (gate.arity > max_arity_) {
            max_arity_ = gate.arity;
        }
    }
}

std::optional<size_t> GateLibrary::find(std::string_view name) const {
    std::string upper = to_upper(name);
    for (size_t i = 0; i < gates_.size(); i++) {
        if (to_upper(gates_[i].name) == upper) {
            return i;
        }
    }
    return std::nullopt;
}

bool GateLibrary::has_gate(GateType function, int arity) const {
    for (const GateDescriptor& gate : gates_) {
        if (gate.function == function && gate.arity == arity) {
            return true;
        }
    }
    return false;
}

GateLibrary standard_gate_library(double cost) {
    static const char* const NAMES[] = {"NOT",  "AND2",  "OR2",   "NOR2",  "NAND2",
                                        "XOR2", "XNOR2", "AND3",  "OR3",   "NAND3",
                                        "NOR3", "AND4",  "OR4",   "NAND4", "NOR4"};
    std::vector<GateDescriptor> gates;
    for (const char* name : NAMES) {
        gates.push_back(make_gate(name, cost));
    }
    return GateLibrary(std::move(gates));
}

} // namespace gatesynth

/// @file gate.cpp
/// @brief Gate evaluation logic and Gate class implementation

#include "simulation/gate.hpp"

#include "common/text_utils.hpp"

#include <stdexcept>
#include <string>

namespace gatesynth {

namespace {

/// Throws unless the input count is legal for the gate family
void check_input_count(GateType type, size_t count) {
    if (is_unary(type)) {
        if (count != 1) {
            throw std::invalid_argument(std::string(gate_type_name(type)) +
                                        " gate requires exactly 1 input");
        }
    } else if (count < 2) {
        throw std::invalid_argument(std::string(gate_type_name(type)) +
                                    " gate requires at least 2 inputs");
    }
}

} // namespace

std::optional<GateType> parse_gate_type(std::string_view name) {
    std::string upper = to_upper(name);

    if (upper == "NOT" || upper == "INV") {
        return GateType::NOT;
    }
    if (upper == "BUFFER" || upper == "BUF") {
        return GateType::BUFFER;
    }
    if (upper == "AND") {
        return GateType::AND;
    }
    if (upper == "NAND") {
        return GateType::NAND;
    }
    if (upper == "OR") {
        return GateType::OR;
    }
    if (upper == "NOR") {
        return GateType::NOR;
    }
    if (upper == "XOR") {
        return GateType::XOR;
    }
    if (upper == "XNOR") {
        return GateType::XNOR;
    }
    return std::nullopt;
}

bool evaluate(GateType type, const std::vector<bool>& inputs) {
    check_input_count(type, inputs.size());

    switch (type) {
    case GateType::NOT:
        return !inputs[0];

    case GateType::BUFFER:
        return inputs[0];

    case GateType::AND:
    case GateType::NAND: {
        bool result = true;
        for (bool v : inputs) {
            result = result && v;
        }
        return type == GateType::NAND ? !result : result;
    }

    case GateType::OR:
    case GateType::NOR: {
        bool result = false;
        for (bool v : inputs) {
            result = result || v;
        }
        return type == GateType::NOR ? !result : result;
    }

    case GateType::XOR:
    case GateType::XNOR: {
        bool result = false;
        for (bool v : inputs) {
            result ^= v;
        }
        return type == GateType::XNOR ? !result : result;
    }
    }
    throw std::invalid_argument("Unknown gate type");
}

uint64_t evaluate_word(GateType type, const std::vector<uint64_t>& inputs) {
    check_input_count(type, inputs.size());

    uint64_t result = 0;
    switch (type) {
    case GateType::NOT:
    case GateType::BUFFER:
        result = inputs[0];
        break;

    case GateType::AND:
    case GateType::NAND:
        result = ~uint64_t{0};
        for (uint64_t w : inputs) {
            result &= w;
        }
        break;

    case GateType::OR:
    case GateType::NOR:
        for (uint64_t w : inputs) {
            result |= w;
        }
        break;

    case GateType::XOR:
    case GateType::XNOR:
        for (uint64_t w : inputs) {
            result ^= w;
        }
        break;
    }
    return is_inverting(type) ? ~result : result;
}

Gate::Gate(uint32_t id, GateType type) : id_(id), type_(type) {}

void Gate::add_input(Wire* wire) {
    inputs_.push_back(wire);
}

} // namespace gatesynth

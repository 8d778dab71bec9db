/// @file circuit.cpp
/// @brief Circuit construction, topological sort (Kahn's algorithm), propagation and truth-table sweeps

#include "simulation/circuit.hpp"

#include <algorithm>
#include <queue>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

namespace gatesynth {

Gate* Circuit::add_gate(GateType type) {
    gates_.push_back(std::make_unique<Gate>(next_gate_id_++, type));
    return gates_.back().get();
}

Wire* Circuit::add_wire() {
    wires_.push_back(std::make_unique<Wire>(next_wire_id_++));
    return wires_.back().get();
}

void Circuit::connect(Wire* wire, Gate* source, Gate* destination) {
    if (wire == nullptr) {
        throw std::invalid_argument("connect() requires a non-null wire");
    }

    if (source != nullptr) {
        if (wire->get_source() != nullptr && wire->get_source() != source) {
            throw std::runtime_error("Wire already has a different source gate");
        }
        if (source->get_output() != nullptr && source->get_output() != wire) {
            throw std::runtime_error("Gate already drives a different output wire");
        }
        wire->set_source(source);
        source->set_output(wire);
    }
    if (destination != nullptr) {
        wire->add_destination(destination);
        destination->add_input(wire);
    }
}

void Circuit::mark_input(Wire* wire) {
    input_wires_.push_back(wire);
}

void Circuit::mark_output(Wire* wire, std::string name) {
    output_wires_.push_back(wire);
    output_names_.push_back(std::move(name));
}

void Circuit::finalize() {
    validate_connectivity();

    // Kahn's algorithm; a gate is ready once every gate feeding it is placed
    std::unordered_map<const Gate*, size_t> pending;
    std::queue<Gate*> ready;
    for (auto& gate : gates_) {
        size_t fed_by_gates = 0;
        for (const Wire* input_wire : gate->get_inputs()) {
            if (input_wire->get_source() != nullptr) {
                fed_by_gates++;
            }
        }
        pending[gate.get()] = fed_by_gates;
        if (fed_by_gates == 0) {
            ready.push(gate.get());
        }
    }

    topo_order_.clear();
    topo_order_.reserve(gates_.size());

    while (!ready.empty()) {
        Gate* current = ready.front();
        ready.pop();
        topo_order_.push_back(current);

        const Wire* out = current->get_output();
        if (out == nullptr) {
            continue;
        }
        for (Gate* dest : out->get_destinations()) {
            if (--pending[dest] == 0) {
                ready.push(dest);
            }
        }
    }

    if (topo_order_.size() != gates_.size()) {
        throw std::runtime_error("Circuit contains a cycle; topological sort failed");
    }

    finalized_ = true;
}

void Circuit::validate_connectivity() const {
    for (const auto& gate : gates_) {
        const auto& inputs = gate->get_inputs();
        bool legal = is_unary(gate->get_type()) ? inputs.size() == 1 : inputs.size() >= 2;
        if (!legal) {
            throw std::runtime_error("Gate " + std::to_string(gate->get_id()) + " (" +
                                     std::string(gate_type_name(gate->get_type())) + ") has " +
                                     std::to_string(inputs.size()) + " inputs");
        }
        if (gate->get_output() == nullptr) {
            throw std::runtime_error("Gate " + std::to_string(gate->get_id()) +
                                     " does not drive an output wire");
        }
        for (const Wire* input_wire : inputs) {
            if (input_wire == nullptr) {
                throw std::runtime_error("Inconsistent connectivity: gate has null input wire");
            }
        }
    }

    for (const Wire* wire : output_wires_) {
        if (wire->get_source() == nullptr &&
            std::find(input_wires_.begin(), input_wires_.end(), wire) == input_wires_.end()) {
            throw std::runtime_error("Primary output wire is driven by neither a gate nor an input");
        }
    }
}

void Circuit::set_input(size_t index, bool value) {
    if (index >= input_wires_.size()) {
        throw std::out_of_range("Input index out of range");
    }
    input_wires_[index]->set_value(value);
}

void Circuit::propagate() {
    if (!finalized_) {
        throw std::runtime_error("Circuit must be finalized before propagation");
    }

    std::vector<bool> input_values;
    for (Gate* gate : topo_order_) {
        // Gather current input values from this gate's input wires
        input_values.clear();
        for (Wire* w : gate->get_inputs()) {
            input_values.push_back(w->get_value());
        }

        bool state = evaluate(gate->get_type(), input_values);
        gate->set_state(state);
        if (Wire* out = gate->get_output(); out != nullptr) {
            out->set_value(state);
        }
    }
}

bool Circuit::get_output(size_t index) const {
    if (index >= output_wires_.size()) {
        throw std::out_of_range("Output index out of range");
    }
    return output_wires_[index]->get_value();
}

std::vector<BitVector> Circuit::simulate_truth_table() {
    std::vector<BitVector> canonical;
    for (size_t i = 0; i < input_wires_.size(); i++) {
        canonical.push_back(input_column(input_wires_.size(), i));
    }
    return simulate_columns(canonical);
}

std::vector<BitVector> Circuit::simulate_columns(const std::vector<BitVector>& input_columns) {
    if (!finalized_) {
        throw std::runtime_error("Circuit must be finalized before simulation");
    }
    if (input_columns.size() != input_wires_.size()) {
        throw std::invalid_argument("Expected one column per primary input");
    }

    size_t rows = input_columns.empty() ? 1 : input_columns.front().size();
    for (const BitVector& column : input_columns) {
        if (column.size() != rows) {
            throw std::invalid_argument("Input columns must have equal length");
        }
    }

    std::vector<BitVector> outputs(output_wires_.size(), BitVector(rows));
    for (size_t row = 0; row < rows; row++) {
        for (size_t i = 0; i < input_columns.size(); i++) {
            set_input(i, input_columns[i].get(row));
        }
        propagate();
        for (size_t o = 0; o < output_wires_.size(); o++) {
            outputs[o].set(row, output_wires_[o]->get_value());
        }
    }
    return outputs;
}

double Circuit::total_cost() const {
    double cost = 0.0;
    for (const auto& gate : gates_) {
        cost += gate->get_cost();
    }
    return cost;
}

int Circuit::depth() const {
    // Longest path, computed in topological order
    std::unordered_map<const Gate*, int> gate_depth;
    int max_depth = 0;
    for (const Gate* gate : topo_order_) {
        int d = 1;
        for (const Wire* w : gate->get_inputs()) {
            if (const Gate* src = w->get_source(); src != nullptr) {
                d = std::max(d, gate_depth[src] + 1);
            }
        }
        gate_depth[gate] = d;
        max_depth = std::max(max_depth, d);
    }
    return max_depth;
}

} // namespace gatesynth

/// @file report.cpp
/// @brief Expression and netlist text rendering

#include "io/report.hpp"

#include <cstdio>
#include <stdexcept>

namespace gatesynth {

namespace {

std::string wire_label(const Wire* wire) {
    if (wire->get_source() == nullptr && !wire->get_name().empty()) {
        return wire->get_name();
    }
    return "n" + std::to_string(wire->get_id());
}

} // namespace

std::string render_expression(const SignalPool& pool, SignalId signal) {
    return render_expression(pool, pool.at(signal).origin);
}

std::string render_expression(const SignalPool& pool, const Origin& origin) {
    if (origin.is_leaf()) {
        return origin.input_name;
    }
    std::string text = pool.library().at(*origin.gate).name + "(";
    for (size_t i = 0; i < origin.inputs.size(); i++) {
        if (i > 0) {
            text += ", ";
        }
        text += render_expression(pool, origin.inputs[i]);
    }
    return text + ")";
}

std::string render_netlist(const Circuit& circuit) {
    if (!circuit.is_finalized()) {
        throw std::runtime_error("Circuit must be finalized before it can be rendered");
    }

    std::string text;
    for (const Gate* gate : circuit.topological_order()) {
        std::string cell = gate->get_cell_name();
        if (cell.empty()) {
            cell = std::string(gate_type_name(gate->get_type()));
        }
        text += wire_label(gate->get_output()) + " = " + cell + "(";
        const std::vector<Wire*>& inputs = gate->get_inputs();
        for (size_t i = 0; i < inputs.size(); i++) {
            text += (i == 0 ? "" : ", ") + wire_label(inputs[i]);
        }
        text += ")\n";
    }

    const std::vector<Wire*>& outputs = circuit.output_wires();
    const std::vector<std::string>& names = circuit.output_names();
    for (size_t i = 0; i < outputs.size(); i++) {
        std::string name = names[i].empty() ? "Out" + std::to_string(i) : names[i];
        text += name + " = " + wire_label(outputs[i]) + "\n";
    }
    return text;
}

std::string netlist_summary(const Circuit& circuit) {
    size_t gates = circuit.gates().size();
    return std::to_string(gates) + (gates == 1 ? " gate" : " gates") + ", cost " +
           format_cost(circuit.total_cost()) + ", depth " + std::to_string(circuit.depth());
}

std::string format_cost(double cost) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%g", cost);
    return buffer;
}

} // namespace gatesynth

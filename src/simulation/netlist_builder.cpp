/// @file netlist_builder.cpp
/// @brief Implementation of the pool-to-circuit materializer

#include "simulation/netlist_builder.hpp"

#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace gatesynth {

namespace {

/// Creates gates and wires on demand while walking signal origins
class NetlistWriter {
  public:
    NetlistWriter(const SignalPool& pool, Circuit& circuit) : pool_(pool), circuit_(circuit) {
        LevelRange leaves = pool_.level_range(0);
        for (SignalId id = leaves.begin; id < leaves.end; id++) {
            Wire* wire = circuit_.add_wire();
            wire->set_name(pool_[id].origin.input_name);
            circuit_.mark_input(wire);
            wires_[id] = wire;
        }
    }

    /// Wire carrying a pool signal, materializing its cone first
    Wire* signal_wire(SignalId id) {
        if (auto it = wires_.find(id); it != wires_.end()) {
            return it->second;
        }
        const Signal& signal = pool_.at(id);
        if (signal.origin.is_leaf()) {
            throw std::out_of_range("Leaf signal " + std::to_string(id) + " is not a pool input");
        }
        Wire* out = gate_wire(signal.origin);
        wires_[id] = out;
        return out;
    }

    /// Wire carrying an arbitrary derived origin over pool signals
    Wire* gate_wire(const Origin& origin) {
        const GateDescriptor& descriptor = pool_.library().at(*origin.gate);

        std::vector<Wire*> inputs;
        for (SignalId input : origin.inputs) {
            inputs.push_back(signal_wire(input));
        }

        Gate* gate = circuit_.add_gate(descriptor.function);
        gate->set_cell(descriptor.name, descriptor.cost);
        for (Wire* input : inputs) {
            circuit_.connect(input, nullptr, gate);
        }
        Wire* out = circuit_.add_wire();
        circuit_.connect(out, gate, nullptr);
        return out;
    }

    /// Wire for a leaf origin, looked up by variable name
    Wire* leaf_wire(const std::string& name) {
        for (Wire* wire : circuit_.input_wires()) {
            if (wire->get_name() == name) {
                return wire;
            }
        }
        throw std::out_of_range("No input variable named '" + name + "'");
    }

  private:
    const SignalPool& pool_;
    Circuit& circuit_;
    std::unordered_map<SignalId, Wire*> wires_;
};

} // namespace

std::unique_ptr<Circuit> build_netlist(const SignalPool& pool, const std::vector<NetlistOutput>& outputs) {
    auto circuit = std::make_unique<Circuit>();
    NetlistWriter writer(pool, *circuit);

    std::vector<std::pair<const Origin*, Wire*>> separate;
    for (const NetlistOutput& output : outputs) {
        Wire* wire = nullptr;
        if (output.signal) {
            wire = writer.signal_wire(*output.signal);
        } else if (output.origin.is_leaf()) {
            wire = writer.leaf_wire(output.origin.input_name);
        } else {
            for (const auto& [origin, existing] : separate) {
                if (*origin == output.origin) {
                    wire = existing;
                }
            }
            if (wire == nullptr) {
                wire = writer.gate_wire(output.origin);
                separate.emplace_back(&output.origin, wire);
            }
        }
        circuit->mark_output(wire, output.name);
    }

    circuit->finalize();
    return circuit;
}

std::unique_ptr<Circuit> build_netlist(const SignalPool& pool, SignalId signal,
                                       const std::string& output_name) {
    NetlistOutput output;
    output.name = output_name;
    output.origin = pool.at(signal).origin;
    output.signal = signal;
    return build_netlist(pool, std::vector<NetlistOutput>{output});
}

std::vector<BitVector> leaf_columns(const SignalPool& pool) {
    std::vector<BitVector> columns;
    LevelRange leaves = pool.level_range(0);
    for (SignalId id = leaves.begin; id < leaves.end; id++) {
        columns.push_back(pool[id].bits);
    }
    return columns;
}

} // namespace gatesynth

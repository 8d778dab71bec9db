/// @file test_circuit.cpp
/// @brief Tests for the Circuit class: construction, topological sort, validation, sweeps

#include <catch2/catch.hpp>

#include "simulation/circuit.hpp"

using namespace gatesynth;

namespace {

/// in -> NOT -> NOT -> out
struct InverterChain {
    Circuit circuit;
    Gate* first = nullptr;
    Gate* second = nullptr;

    InverterChain() {
        Wire* input = circuit.add_wire();
        circuit.mark_input(input);

        first = circuit.add_gate(GateType::NOT);
        second = circuit.add_gate(GateType::NOT);

        Wire* mid = circuit.add_wire();
        Wire* output = circuit.add_wire();
        circuit.mark_output(output, "Y");

        circuit.connect(input, nullptr, first);
        circuit.connect(mid, first, second);
        circuit.connect(output, second, nullptr);
        circuit.finalize();
    }
};

} // namespace

TEST_CASE("Single inverter propagates both rows", "[circuit]") {
    Circuit circuit;

    Wire* input = circuit.add_wire();
    circuit.mark_input(input);
    Gate* not_gate = circuit.add_gate(GateType::NOT);
    Wire* output = circuit.add_wire();
    circuit.mark_output(output);

    circuit.connect(input, nullptr, not_gate);
    circuit.connect(output, not_gate, nullptr);
    circuit.finalize();

    SECTION("NOT(false) = true") {
        circuit.set_input(0, false);
        circuit.propagate();
        CHECK(circuit.get_output(0) == true);
    }

    SECTION("NOT(true) = false") {
        circuit.set_input(0, true);
        circuit.propagate();
        CHECK(circuit.get_output(0) == false);
    }
}

TEST_CASE("Inverter chain acts as a buffer and keeps topological order", "[circuit]") {
    InverterChain chain;

    chain.circuit.set_input(0, true);
    chain.circuit.propagate();
    CHECK(chain.circuit.get_output(0) == true);

    const auto& order = chain.circuit.topological_order();
    REQUIRE(order.size() == 2);
    CHECK(order[0] == chain.first);
    CHECK(order[1] == chain.second);

    CHECK(chain.circuit.depth() == 2);
    CHECK(chain.circuit.output_names() == std::vector<std::string>{"Y"});
    CHECK(chain.circuit.is_finalized());
}

TEST_CASE("simulate_truth_table sweeps rows in canonical order", "[circuit]") {
    // Out = NAND(A, B) with A as the most significant row bit
    Circuit circuit;
    Wire* a = circuit.add_wire();
    Wire* b = circuit.add_wire();
    circuit.mark_input(a);
    circuit.mark_input(b);

    Gate* nand = circuit.add_gate(GateType::NAND);
    nand->set_cell("NAND2", 1.5);
    Wire* out = circuit.add_wire();
    circuit.mark_output(out, "Out");

    circuit.connect(a, nullptr, nand);
    circuit.connect(b, nullptr, nand);
    circuit.connect(out, nand, nullptr);
    circuit.finalize();

    std::vector<BitVector> columns = circuit.simulate_truth_table();
    REQUIRE(columns.size() == 1);
    CHECK(columns[0].to_string() == "1110");
    CHECK(circuit.total_cost() == 1.5);
}

TEST_CASE("simulate_columns follows caller-supplied row order", "[circuit]") {
    InverterChain chain;

    std::vector<BitVector> out = chain.circuit.simulate_columns({BitVector::from_string("1101")});
    REQUIRE(out.size() == 1);
    CHECK(out[0].to_string() == "1101");

    CHECK_THROWS_AS(chain.circuit.simulate_columns({}), std::invalid_argument);
}

TEST_CASE("An output may be a primary input directly", "[circuit]") {
    Circuit circuit;
    Wire* a = circuit.add_wire();
    circuit.mark_input(a);
    circuit.mark_output(a, "A_copy");
    circuit.finalize();

    std::vector<BitVector> columns = circuit.simulate_truth_table();
    REQUIRE(columns.size() == 1);
    CHECK(columns[0].to_string() == "01");
    CHECK(circuit.depth() == 0);
}

TEST_CASE("Circuit rejects propagation and simulation before finalize", "[circuit]") {
    Circuit circuit;
    CHECK_THROWS_AS(circuit.propagate(), std::runtime_error);
    CHECK_THROWS_AS(circuit.simulate_truth_table(), std::runtime_error);
}

TEST_CASE("Input/output index bounds checking", "[circuit]") {
    Circuit circuit;
    Wire* w = circuit.add_wire();
    circuit.mark_input(w);
    circuit.mark_output(w);

    CHECK_THROWS_AS(circuit.set_input(1, true), std::out_of_range);
    CHECK_THROWS_AS(circuit.get_output(1), std::out_of_range);
}

TEST_CASE("connect() rejects a second driver or a second output wire", "[circuit]") {
    Circuit circuit;

    Gate* g1 = circuit.add_gate(GateType::NOT);
    Gate* g2 = circuit.add_gate(GateType::NOT);
    Wire* w1 = circuit.add_wire();
    Wire* w2 = circuit.add_wire();

    circuit.connect(w1, g1, nullptr);
    CHECK_THROWS_AS(circuit.connect(w1, g2, nullptr), std::runtime_error);
    CHECK_THROWS_AS(circuit.connect(w2, g1, nullptr), std::runtime_error);
    CHECK_THROWS_AS(circuit.connect(nullptr, g1, nullptr), std::invalid_argument);
}

TEST_CASE("finalize() validates gates and outputs", "[circuit]") {
    SECTION("Output wire with no driver") {
        Circuit circuit;
        Wire* in = circuit.add_wire();
        circuit.mark_input(in);
        Gate* not_gate = circuit.add_gate(GateType::NOT);
        Wire* out = circuit.add_wire();
        circuit.mark_output(out);

        // One-sided links, bypassing Circuit::connect
        not_gate->add_input(in);
        not_gate->set_output(circuit.add_wire());

        CHECK_THROWS_AS(circuit.finalize(), std::runtime_error);
    }

    SECTION("Two-input family with a single input") {
        Circuit circuit;
        Wire* in = circuit.add_wire();
        circuit.mark_input(in);
        Gate* and_gate = circuit.add_gate(GateType::AND);
        Wire* out = circuit.add_wire();
        circuit.connect(in, nullptr, and_gate);
        circuit.connect(out, and_gate, nullptr);
        circuit.mark_output(out);

        CHECK_THROWS_AS(circuit.finalize(), std::runtime_error);
    }

    SECTION("Gate without an output wire") {
        Circuit circuit;
        Wire* in = circuit.add_wire();
        circuit.mark_input(in);
        Gate* not_gate = circuit.add_gate(GateType::NOT);
        circuit.connect(in, nullptr, not_gate);

        CHECK_THROWS_AS(circuit.finalize(), std::runtime_error);
    }
}

TEST_CASE("finalize() detects cycles", "[circuit]") {
    Circuit circuit;
    Wire* in = circuit.add_wire();
    circuit.mark_input(in);

    Gate* g1 = circuit.add_gate(GateType::AND);
    Gate* g2 = circuit.add_gate(GateType::NOT);
    Wire* loop = circuit.add_wire();
    Wire* back = circuit.add_wire();

    circuit.connect(in, nullptr, g1);
    circuit.connect(back, g2, g1);
    circuit.connect(loop, g1, g2);
    circuit.mark_output(loop);

    CHECK_THROWS_AS(circuit.finalize(), std::runtime_error);
}

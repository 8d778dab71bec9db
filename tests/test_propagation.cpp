/// @file test_propagation.cpp
/// @brief Tests for topological ordering, fan-out and multi-output sweeps

#include <catch2/catch.hpp>

#include "simulation/circuit.hpp"

#include <algorithm>

using namespace gatesynth;

TEST_CASE("Gates created out of order are still sorted by dependency", "[propagation]") {
    // Out = NOT(AND(A, B)), with the NOT gate created first
    Circuit circuit;

    Wire* a = circuit.add_wire();
    Wire* b = circuit.add_wire();
    circuit.mark_input(a);
    circuit.mark_input(b);

    Gate* not_gate = circuit.add_gate(GateType::NOT);
    Gate* and_gate = circuit.add_gate(GateType::AND);

    Wire* and_out = circuit.add_wire();
    Wire* not_out = circuit.add_wire();
    circuit.mark_output(not_out);

    circuit.connect(a, nullptr, and_gate);
    circuit.connect(b, nullptr, and_gate);
    circuit.connect(and_out, and_gate, not_gate);
    circuit.connect(not_out, not_gate, nullptr);
    circuit.finalize();

    const auto& order = circuit.topological_order();
    REQUIRE(order.size() == 2);
    auto and_pos = std::find(order.begin(), order.end(), and_gate);
    auto not_pos = std::find(order.begin(), order.end(), not_gate);
    CHECK(and_pos < not_pos);

    CHECK(circuit.simulate_truth_table()[0].to_string() == "1110");
}

TEST_CASE("Diamond: XOR built from four NAND gates", "[propagation]") {
    // t = NAND(A, B), Out = NAND(NAND(A, t), NAND(B, t))
    Circuit circuit;
    Wire* a = circuit.add_wire();
    Wire* b = circuit.add_wire();
    circuit.mark_input(a);
    circuit.mark_input(b);

    Gate* g_t = circuit.add_gate(GateType::NAND);
    Gate* g_a = circuit.add_gate(GateType::NAND);
    Gate* g_b = circuit.add_gate(GateType::NAND);
    Gate* g_out = circuit.add_gate(GateType::NAND);

    Wire* t = circuit.add_wire();
    Wire* wa = circuit.add_wire();
    Wire* wb = circuit.add_wire();
    Wire* out = circuit.add_wire();

    circuit.connect(a, nullptr, g_t);
    circuit.connect(b, nullptr, g_t);
    circuit.connect(t, g_t, g_a);
    circuit.connect(t, nullptr, g_b);
    circuit.connect(a, nullptr, g_a);
    circuit.connect(b, nullptr, g_b);
    circuit.connect(wa, g_a, g_out);
    circuit.connect(wb, g_b, g_out);
    circuit.connect(out, g_out, nullptr);
    circuit.mark_output(out, "Out");
    circuit.finalize();

    CHECK(t->get_destinations().size() == 2);
    CHECK(circuit.simulate_truth_table()[0].to_string() == "0110");
    CHECK(circuit.depth() == 3);
    CHECK(circuit.topological_order().front() == g_t);
    CHECK(circuit.topological_order().back() == g_out);
}

TEST_CASE("One wire can drive several outputs", "[propagation]") {
    Circuit circuit;
    Wire* a = circuit.add_wire();
    Wire* b = circuit.add_wire();
    circuit.mark_input(a);
    circuit.mark_input(b);

    Gate* or_gate = circuit.add_gate(GateType::OR);
    Gate* nor_gate = circuit.add_gate(GateType::NOR);
    Wire* or_out = circuit.add_wire();
    Wire* nor_out = circuit.add_wire();

    circuit.connect(a, nullptr, or_gate);
    circuit.connect(b, nullptr, or_gate);
    circuit.connect(a, nullptr, nor_gate);
    circuit.connect(b, nullptr, nor_gate);
    circuit.connect(or_out, or_gate, nullptr);
    circuit.connect(nor_out, nor_gate, nullptr);

    circuit.mark_output(or_out, "Any");
    circuit.mark_output(nor_out, "None");
    circuit.mark_output(or_out, "AnyAgain");
    circuit.finalize();

    std::vector<BitVector> columns = circuit.simulate_truth_table();
    REQUIRE(columns.size() == 3);
    CHECK(columns[0].to_string() == "0111");
    CHECK(columns[1].to_string() == "1000");
    CHECK(columns[2] == columns[0]);
    CHECK(circuit.num_outputs() == 3);
}

TEST_CASE("Repeated propagation overwrites previous state", "[propagation]") {
    Circuit circuit;
    Wire* a = circuit.add_wire();
    Wire* b = circuit.add_wire();
    Wire* c = circuit.add_wire();
    circuit.mark_input(a);
    circuit.mark_input(b);
    circuit.mark_input(c);

    Gate* xor3 = circuit.add_gate(GateType::XOR);
    Wire* out = circuit.add_wire();
    circuit.connect(a, nullptr, xor3);
    circuit.connect(b, nullptr, xor3);
    circuit.connect(c, nullptr, xor3);
    circuit.connect(out, xor3, nullptr);
    circuit.mark_output(out);
    circuit.finalize();

    circuit.set_input(0, true);
    circuit.set_input(1, true);
    circuit.set_input(2, true);
    circuit.propagate();
    CHECK(circuit.get_output(0) == true);
    CHECK(xor3->get_state() == true);

    circuit.set_input(2, false);
    circuit.propagate();
    CHECK(circuit.get_output(0) == false);

    CHECK(circuit.simulate_truth_table()[0].to_string() == "01101001");
}

/// @file test_netlist.cpp
/// @brief Tests for materializing pool signals as gate/wire circuits

#include <catch2/catch.hpp>

#include "simulation/netlist_builder.hpp"

using namespace gatesynth;

namespace {

/// 0 = A, 1 = B, 2 = NAND(A, B), 3 = NAND(2, 2), 4 = NAND(A, 2)
struct NandPool {
    GateLibrary library{std::vector<GateDescriptor>{make_gate("NAND2", 1.5)}};
    SignalPool pool{library, 4};

    NandPool() {
        (void)pool.try_insert(input_column(2, 0), Origin::leaf("A"), 0);
        (void)pool.try_insert(input_column(2, 1), Origin::leaf("B"), 0);
        (void)pool.try_insert(BitVector::from_string("1110"), Origin::derived(0, {0, 1}), 1);
        (void)pool.try_insert(BitVector::from_string("0001"), Origin::derived(0, {2, 2}), 2);
        (void)pool.try_insert(BitVector::from_string("1101"), Origin::derived(0, {0, 2}), 2);
    }
};

} // namespace

TEST_CASE("A single signal becomes its cone", "[netlist]") {
    NandPool fixture;
    auto circuit = build_netlist(fixture.pool, 3, "And");

    CHECK(circuit->num_inputs() == 2);
    CHECK(circuit->input_wires()[0]->get_name() == "A");
    CHECK(circuit->input_wires()[1]->get_name() == "B");
    REQUIRE(circuit->gates().size() == 2);
    CHECK(circuit->gates()[0]->get_cell_name() == "NAND2");
    CHECK(circuit->total_cost() == 3.0);
    CHECK(circuit->depth() == 2);
    CHECK(circuit->output_names() == std::vector<std::string>{"And"});

    CHECK(circuit->simulate_truth_table()[0].to_string() == "0001");
}

TEST_CASE("Outputs sharing a sub-circuit reuse its gates", "[netlist]") {
    NandPool fixture;
    std::vector<NetlistOutput> outputs = {
        {"And", fixture.pool[3].origin, SignalId{3}},
        {"Imp", fixture.pool[4].origin, SignalId{4}},
        {"Nand", fixture.pool[2].origin, SignalId{2}},
    };
    auto circuit = build_netlist(fixture.pool, outputs);

    CHECK(circuit->gates().size() == 3);
    CHECK(circuit->total_cost() == 4.5);

    std::vector<BitVector> columns = circuit->simulate_columns(leaf_columns(fixture.pool));
    REQUIRE(columns.size() == 3);
    CHECK(columns[0].to_string() == "0001");
    CHECK(columns[1].to_string() == "1101");
    CHECK(columns[2].to_string() == "1110");
}

TEST_CASE("Derivations outside the pool get their own gate", "[netlist]") {
    NandPool fixture;
    // NAND(B, 2) is not a pool signal; used twice it is still built once
    Origin extra = Origin::derived(0, {1, 2});
    std::vector<NetlistOutput> outputs = {
        {"X", extra, std::nullopt},
        {"Y", extra, std::nullopt},
        {"Pass", Origin::leaf("B"), std::nullopt},
    };
    auto circuit = build_netlist(fixture.pool, outputs);

    CHECK(circuit->gates().size() == 2);
    std::vector<BitVector> columns = circuit->simulate_truth_table();
    CHECK(columns[0].to_string() == "1011");
    CHECK(columns[1] == columns[0]);
    CHECK(columns[2].to_string() == "0101");
    CHECK(circuit->output_wires()[0] == circuit->output_wires()[1]);
}

TEST_CASE("Unknown references are rejected", "[netlist]") {
    NandPool fixture;
    CHECK_THROWS_AS(build_netlist(fixture.pool, 42), std::out_of_range);

    std::vector<NetlistOutput> outputs = {{"Z", Origin::leaf("Q"), std::nullopt}};
    CHECK_THROWS_AS(build_netlist(fixture.pool, outputs), std::out_of_range);
}

TEST_CASE("leaf_columns lists the pool inputs in order", "[netlist]") {
    NandPool fixture;
    std::vector<BitVector> leaves = leaf_columns(fixture.pool);
    REQUIRE(leaves.size() == 2);
    CHECK(leaves[0].to_string() == "0011");
    CHECK(leaves[1].to_string() == "0101");
}

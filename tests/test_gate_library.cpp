/// @file test_gate_library.cpp
/// @brief Tests for gate descriptors, library validation and column evaluation

#include <catch2/catch.hpp>

#include "synthesis/errors.hpp"
#include "synthesis/gate_library.hpp"

using namespace gatesynth;

// ---------- Descriptors from cell names ----------

TEST_CASE("make_gate derives family and arity from the name", "[gate]") {
    GateDescriptor nand3 = make_gate("nand3", 2.0);
    CHECK(nand3.name == "NAND3");
    CHECK(nand3.function == GateType::NAND);
    CHECK(nand3.arity == 3);
    CHECK(nand3.cost == 2.0);

    CHECK(make_gate("NOT", 1.0).arity == 1);
    CHECK(make_gate("BUF", 1.0).function == GateType::BUFFER);
    CHECK(make_gate("XOR", 1.0).arity == 2);
    CHECK(make_gate("Xnor2", 1.0).function == GateType::XNOR);
}

TEST_CASE("make_gate rejects unknown families", "[gate]") {
    CHECK_THROWS_AS(make_gate("MUX2", 1.0), ConfigurationError);
    CHECK_THROWS_AS(make_gate("2", 1.0), ConfigurationError);
    CHECK_THROWS_AS(make_gate("AND123", 1.0), ConfigurationError);
}

// ---------- Library validation ----------

TEST_CASE("GateLibrary validates its entries", "[gate]") {
    CHECK_THROWS_AS(GateLibrary(std::vector<GateDescriptor>{}), ConfigurationError);
    CHECK_THROWS_AS(GateLibrary({make_gate("AND2", 1.0), make_gate("and2", 2.0)}), ConfigurationError);
    CHECK_THROWS_AS(GateLibrary({make_gate("AND5", 1.0)}), ConfigurationError);
    CHECK_THROWS_AS(GateLibrary({make_gate("OR1", 1.0)}), ConfigurationError);
    CHECK_THROWS_AS(GateLibrary({make_gate("NOT2", 1.0)}), ConfigurationError);
    CHECK_THROWS_AS(GateLibrary({make_gate("NAND2", -1.0)}), ConfigurationError);
}

TEST_CASE("GateLibrary keeps order and supports lookup", "[gate]") {
    GateLibrary library({make_gate("NOT", 1.0), make_gate("NAND3", 3.0), make_gate("NAND2", 2.0)});

    REQUIRE(library.size() == 3);
    CHECK(library[0].name == "NOT");
    CHECK(library[2].name == "NAND2");
    CHECK(library.max_arity() == 3);

    CHECK(library.find("nand2") == size_t{2});
    CHECK_FALSE(library.find("XOR2").has_value());

    CHECK(library.has_gate(GateType::NAND, 3));
    CHECK_FALSE(library.has_gate(GateType::NAND, 4));
    CHECK_THROWS_AS(library.at(3), std::out_of_range);
}

TEST_CASE("Standard library holds every built-in cell", "[gate]") {
    GateLibrary library = standard_gate_library(1.5);
    CHECK(library.size() == 15);
    CHECK(library.max_arity() == 4);
    for (const GateDescriptor& gate : library) {
        CHECK(gate.cost == 1.5);
    }
    CHECK(library.find("XNOR2").has_value());
    CHECK(library.find("NOR4").has_value());
}

// ---------- Column evaluation ----------

TEST_CASE("evaluate_gate works on whole columns", "[gate]") {
    BitVector a = input_column(2, 0);
    BitVector b = input_column(2, 1);

    CHECK(evaluate_gate(make_gate("NAND2", 1.0), {&a, &b}).to_string() == "1110");
    CHECK(evaluate_gate(make_gate("XOR2", 1.0), {&a, &b}).to_string() == "0110");
    CHECK(evaluate_gate(make_gate("NOT", 1.0), {&a}).to_string() == "1100");
    CHECK(evaluate_gate(make_gate("OR3", 1.0), {&a, &b, &b}).to_string() == "0111");
}

TEST_CASE("evaluate_gate keeps the tail of wide columns clean", "[gate]") {
    // 5 variables fill half a word
    BitVector x = input_column(5, 0);
    BitVector y = ~x;
    BitVector nor = evaluate_gate(make_gate("NOR2", 1.0), {&x, &y});
    CHECK(nor == BitVector(32));
    BitVector nand = evaluate_gate(make_gate("NAND2", 1.0), {&x, &y});
    CHECK(nand == BitVector::constant(32, true));
    CHECK(nand.word(0) == 0xFFFFFFFFULL);
}

TEST_CASE("evaluate_gate rejects mismatched inputs", "[gate]") {
    BitVector a = input_column(2, 0);
    BitVector short_column(2);
    GateDescriptor and2 = make_gate("AND2", 1.0);

    CHECK_THROWS_AS(evaluate_gate(and2, {&a}), std::invalid_argument);
    CHECK_THROWS_AS(evaluate_gate(and2, {&a, &short_column}), std::invalid_argument);
}

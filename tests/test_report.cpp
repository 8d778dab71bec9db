/// @file test_report.cpp
/// @brief Tests for expression/netlist rendering and the search log

#include <catch2/catch.hpp>

#include "io/report.hpp"
#include "io/search_log.hpp"
#include "simulation/netlist_builder.hpp"

#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>

using namespace gatesynth;

namespace {

/// 0 = A, 1 = B, 2 = NAND(A, B), 3 = NAND(2, 2)
struct NandPool {
    GateLibrary library{std::vector<GateDescriptor>{make_gate("NAND2", 1.5)}};
    SignalPool pool{library, 4};

    NandPool() {
        (void)pool.try_insert(input_column(2, 0), Origin::leaf("A"), 0);
        (void)pool.try_insert(input_column(2, 1), Origin::leaf("B"), 0);
        (void)pool.try_insert(BitVector::from_string("1110"), Origin::derived(0, {0, 1}), 1);
        (void)pool.try_insert(BitVector::from_string("0001"), Origin::derived(0, {2, 2}), 2);
    }
};

using FilePtr = std::unique_ptr<std::FILE, int (*)(std::FILE*)>;

/// Everything written to a temporary file so far
std::string contents(std::FILE* file) {
    std::fflush(file);
    std::rewind(file);
    std::string text;
    char buffer[512];
    size_t n = 0;
    while ((n = std::fread(buffer, 1, sizeof(buffer), file)) > 0) {
        text.append(buffer, n);
    }
    return text;
}

bool has(const std::string& text, const std::string& fragment) {
    return text.find(fragment) != std::string::npos;
}

} // namespace

// ---------- Rendering ----------

TEST_CASE("Pool signals render as nested gate calls", "[report]") {
    NandPool fixture;
    CHECK(render_expression(fixture.pool, 0) == "A");
    CHECK(render_expression(fixture.pool, 2) == "NAND2(A, B)");
    CHECK(render_expression(fixture.pool, 3) == "NAND2(NAND2(A, B), NAND2(A, B))");
    CHECK(render_expression(fixture.pool, Origin::derived(0, {1, 3})) ==
          "NAND2(B, NAND2(NAND2(A, B), NAND2(A, B)))");
    CHECK_THROWS_AS(render_expression(fixture.pool, 9), std::out_of_range);
}

TEST_CASE("Netlists list gates in evaluation order", "[report]") {
    NandPool fixture;

    SECTION("One output") {
        auto circuit = build_netlist(fixture.pool, 3, "And");
        CHECK(render_netlist(*circuit) == "n2 = NAND2(A, B)\n"
                                          "n3 = NAND2(n2, n2)\n"
                                          "And = n3\n");
        CHECK(netlist_summary(*circuit) == "2 gates, cost 3, depth 2");
    }

    SECTION("An output wired straight to an input") {
        std::vector<NetlistOutput> outputs = {{"Nand", fixture.pool[2].origin, SignalId{2}},
                                              {"Pass", Origin::leaf("B"), std::nullopt}};
        auto circuit = build_netlist(fixture.pool, outputs);
        CHECK(render_netlist(*circuit) == "n2 = NAND2(A, B)\n"
                                          "Nand = n2\n"
                                          "Pass = B\n");
        CHECK(netlist_summary(*circuit) == "1 gate, cost 1.5, depth 1");
    }

    SECTION("Unfinalized circuits are rejected") {
        Circuit circuit;
        CHECK_THROWS_AS(render_netlist(circuit), std::runtime_error);
    }
}

TEST_CASE("Costs print without trailing zeros", "[report]") {
    CHECK(format_cost(5.0) == "5");
    CHECK(format_cost(2.5) == "2.5");
    CHECK(format_cost(0.0) == "0");
}

// ---------- Search log ----------

TEST_CASE("The search log records levels, candidates and the result", "[report]") {
    FilePtr file(std::tmpfile(), &std::fclose);
    REQUIRE(file);

    GateLibrary library({make_gate("NAND2", 1.0)});
    InputSet inputs = InputSet::canonical(2);
    std::vector<NamedColumn> targets = {{"Xor", BitVector::from_string("0110")}};

    SearchLog log(file.get(), true);
    log.header("input.csv", inputs, "output.csv", targets, "gates.csv", library);

    int progress_calls = 0;
    SearchConfig config;
    config.on_progress = [&progress_calls](const ProgressSnapshot&) { progress_calls++; };
    log.attach(config);

    SingleOutputSearch search(library, inputs, config);
    SingleOutputResult result = search.run(targets[0].bits);
    REQUIRE(result.found());
    log.single_result("Xor", result, search.pool());

    std::string text = contents(file.get());
    CHECK(progress_calls == 3);
    CHECK(has(text, "Inputs from input.csv (2 variables, 4 rows):"));
    CHECK(has(text, "  A: 0011\n"));
    CHECK(has(text, "Gates from gates.csv (1): NAND2[1]"));
    CHECK(has(text, "Level 1: 3 explored, 0 skipped by pruning, 5 signals in pool"));
    CHECK(has(text, "  Trying: NAND2(A, A) [cost=1] -> 1100\n"));
    CHECK(has(text, "(known)"));
    CHECK(has(text, "=== SOLUTION FOUND at level 3 ==="));
    CHECK(has(text, "Cost: 5\n"));
}

TEST_CASE("Quiet logs skip candidates and report partial results", "[report]") {
    FilePtr file(std::tmpfile(), &std::fclose);
    REQUIRE(file);

    GateLibrary library({make_gate("AND2", 1.0)});
    SearchConfig config;
    config.max_complexity = 2;

    SearchLog log(file.get(), false);
    log.attach(config);
    CHECK(config.on_candidate == nullptr);

    MultiOutputSearch search(library, InputSet::canonical(2), config);
    MultiOutputResult result = search.run({{"Carry", BitVector::from_string("0001")},
                                           {"Nand", BitVector::from_string("1110")}});
    log.multi_result(result, search.pool());
    log.error("disk full");

    std::string text = contents(file.get());
    CHECK_FALSE(has(text, "Trying:"));
    CHECK(has(text, "=== PARTIAL SOLUTION ==="));
    CHECK(has(text, "Carry: AND2(A, B) [cost=1, level 1]"));
    CHECK(has(text, "Nand: not found"));
    CHECK(has(text, "Combined cost (shared signals counted once): 1"));
    CHECK(has(text, "ERROR: disk full"));
}

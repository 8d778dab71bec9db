/// @file test_level_generator.cpp
/// @brief Tests for level-by-level candidate enumeration

#include <catch2/catch.hpp>

#include "synthesis/input_set.hpp"
#include "synthesis/level_generator.hpp"

#include <algorithm>
#include <unordered_set>

using namespace gatesynth;

namespace {

void seed(SignalPool& pool, size_t num_vars) {
    const InputSet inputs = InputSet::canonical(num_vars);
    for (const NamedColumn& column : inputs.columns()) {
        (void)pool.try_insert(column.bits, Origin::leaf(column.name), 0);
    }
}

} // namespace

TEST_CASE("First NAND level visits combinations in canonical order", "[generator]") {
    GateLibrary library({make_gate("NAND2", 1.0)});
    SignalPool pool(library, 4);
    seed(pool, 2);
    PruningPolicy pruning(library, 4);
    LevelGenerator generator(pool, pruning);

    std::vector<std::vector<SignalId>> visited;
    generator.set_observer([&](const CandidateEvent& event) { visited.push_back(*event.inputs); });

    LevelStats stats = generator.generate_next_level();
    CHECK(stats.level == 1);
    CHECK(stats.candidates_evaluated == 3);
    CHECK(stats.inserted == 3);
    CHECK(stats.duplicates == 0);

    CHECK(visited == std::vector<std::vector<SignalId>>{{0, 0}, {0, 1}, {1, 1}});
    REQUIRE(pool.size() == 5);
    CHECK(pool[2].bits.to_string() == "1100");
    CHECK(pool[3].bits.to_string() == "1110");
    CHECK(pool[4].bits.to_string() == "1010");
}

TEST_CASE("Later levels only visit tuples touching the frontier", "[generator]") {
    GateLibrary library = standard_gate_library();
    SignalPool pool(library, 8);
    seed(pool, 3);
    PruningPolicy pruning(library, 8);
    LevelGenerator generator(pool, pruning);

    (void)generator.generate_next_level();
    (void)generator.generate_next_level();

    for (SignalId id = 0; id < pool.size(); id++) {
        const Signal& signal = pool[id];
        if (signal.origin.is_leaf()) {
            CHECK(signal.level == 0);
            continue;
        }
        int deepest = -1;
        for (SignalId input : signal.origin.inputs) {
            CHECK(input < id);
            deepest = std::max(deepest, pool[input].level);
        }
        CHECK(deepest == signal.level - 1);
    }
}

TEST_CASE("Pool invariants hold after several levels", "[generator]") {
    GateLibrary library({make_gate("NOT", 1.0), make_gate("AND2", 1.0), make_gate("XOR2", 1.0),
                         make_gate("NOR3", 1.0)});
    SignalPool pool(library, 8);
    seed(pool, 3);
    PruningPolicy pruning(library, 8);
    LevelGenerator generator(pool, pruning);
    for (int i = 0; i < 3; i++) {
        (void)generator.generate_next_level();
    }

    SECTION("Every bit vector appears once") {
        std::unordered_set<BitVector, BitVectorHash> seen;
        for (SignalId id = 0; id < pool.size(); id++) {
            CHECK(seen.insert(pool[id].bits).second);
        }
    }

    SECTION("Levels never decrease along ids") {
        for (SignalId id = 1; id < pool.size(); id++) {
            CHECK(pool[id - 1].level <= pool[id].level);
        }
    }

    SECTION("Every column can be recomputed from its origin") {
        std::vector<BitVector> recomputed = pool.recompute_all();
        for (SignalId id = 0; id < pool.size(); id++) {
            CHECK(recomputed[id] == pool[id].bits);
        }
    }
}

TEST_CASE("Generation is deterministic", "[generator]") {
    GateLibrary library = standard_gate_library();

    auto build = [&](SignalPool& pool) {
        seed(pool, 3);
        PruningPolicy pruning(library, 8);
        LevelGenerator generator(pool, pruning);
        (void)generator.generate_next_level();
        (void)generator.generate_next_level();
    };

    SignalPool first(library, 8);
    SignalPool second(library, 8);
    build(first);
    build(second);

    REQUIRE(first.size() == second.size());
    for (SignalId id = 0; id < first.size(); id++) {
        CHECK(first[id].bits == second[id].bits);
        CHECK(first[id].origin == second[id].origin);
    }
}

TEST_CASE("An exhausted frontier yields empty levels", "[generator]") {
    GateLibrary library({make_gate("NOT", 1.0)});
    SignalPool pool(library, 2);
    seed(pool, 1);
    PruningPolicy pruning(library, 2);
    LevelGenerator generator(pool, pruning);

    CHECK(generator.generate_next_level().inserted == 1); // NOT A
    LevelStats second = generator.generate_next_level();  // NOT NOT A = A
    CHECK(second.duplicates == 1);
    CHECK(second.inserted == 0);
    LevelStats third = generator.generate_next_level();
    CHECK(third.level == 3);
    CHECK(third.candidates_evaluated == 0);
    CHECK(pool.max_level() == 3);
}

TEST_CASE("Level cap drops the most expensive signals", "[generator]") {
    GateLibrary library({make_gate("NAND2", 1.0)});
    SignalPool pool(library, 4);
    seed(pool, 2);
    PruningPolicy pruning(library, 4);
    LevelGenerator generator(pool, pruning);
    generator.set_level_cap(size_t{1});

    LevelStats stats = generator.generate_next_level();
    CHECK(stats.inserted == 3);
    CHECK(stats.removed_by_cap == 2);
    REQUIRE(pool.size() == 3);
    CHECK(pool[2].bits.to_string() == "1100");
}

TEST_CASE("Tick callback fires at the configured cadence", "[generator]") {
    GateLibrary library({make_gate("NAND2", 1.0)});
    SignalPool pool(library, 4);
    seed(pool, 2);
    PruningPolicy pruning(library, 4);
    LevelGenerator generator(pool, pruning);

    std::vector<uint64_t> ticks;
    generator.set_tick(2, [&](const LevelStats& stats) { ticks.push_back(stats.candidates_evaluated); });
    (void)generator.generate_next_level(); // 3 candidates
    (void)generator.generate_next_level(); // frontier of 3 signals: 3 + 4 + 5 = 12 candidates

    CHECK(ticks == std::vector<uint64_t>{2, 2, 4, 6, 8, 10, 12});
}

TEST_CASE("Generating from an unseeded pool is a logic error", "[generator]") {
    GateLibrary library({make_gate("NAND2", 1.0)});
    SignalPool pool(library, 4);
    PruningPolicy pruning(library, 4);
    LevelGenerator generator(pool, pruning);
    CHECK_THROWS_AS(generator.generate_next_level(), std::logic_error);
}

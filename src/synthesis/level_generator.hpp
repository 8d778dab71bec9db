#pragma once

/// @file level_generator.hpp
/// @brief Produces the signals of one complexity level

#include "synthesis/pruning.hpp"
#include "synthesis/search_config.hpp"
#include "synthesis/signal_pool.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>

namespace gatesynth {

/// Counters for one generated level
struct LevelStats {
    int level = 0;
    uint64_t candidates_evaluated = 0;
    uint64_t skipped_by_pruning = 0;
    uint64_t inserted = 0;
    uint64_t duplicates = 0;
    size_t removed_by_cap = 0;
};

/// Generates level L = pool.max_level() + 1.
///
/// For every gate (library order) of arity k, visits the combinations with
/// repetition of k signals from levels below L, as non-decreasing id tuples
/// ordered by their largest id. Only tuples holding at least one signal of
/// level L-1 are visited; every other tuple was already visited at an
/// earlier level. Each tuple passes through the pruning policy, is evaluated,
/// and is offered to the pool.
class LevelGenerator {
  public:
    /// Both referenced objects must outlive the generator.
    LevelGenerator(SignalPool& pool, const PruningPolicy& pruning);

    /// Observer notified after every evaluated candidate
    void set_observer(CandidateObserver observer) { observer_ = std::move(observer); }

    /// Called with the running counters every `every` evaluated candidates
    void set_tick(uint64_t every, std::function<void(const LevelStats&)> tick);

    /// Lossy per-level capacity applied after generation
    void set_level_cap(std::optional<size_t> cap) { cap_ = cap; }

    /// Generates the next level. An empty frontier yields an empty level.
    /// @throws std::logic_error if the pool has not been seeded
    LevelStats generate_next_level();

  private:
    /// Visits one combination
    void visit(size_t gate_index, const std::vector<SignalId>& inputs, LevelStats& stats);

    SignalPool& pool_;
    const PruningPolicy& pruning_;
    CandidateObserver observer_;
    std::function<void(const LevelStats&)> tick_;
    uint64_t tick_every_ = 0;
    std::optional<size_t> cap_;
    std::vector<const BitVector*> columns_; ///< Scratch buffer for gate evaluation
};

} // namespace gatesynth

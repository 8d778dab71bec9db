#pragma once

/// @file search_session.hpp
/// @brief One search run: pool, pruning, generator, budget and telemetry

#include "synthesis/gate_library.hpp"
#include "synthesis/input_set.hpp"
#include "synthesis/level_generator.hpp"
#include "synthesis/pruning.hpp"
#include "synthesis/search_config.hpp"
#include "synthesis/signal_pool.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

namespace gatesynth {

/// Why a search stopped generating levels
enum class StopReason {
    None,
    TargetFound,       ///< Single-output: the target appeared
    MaxComplexity,     ///< The level ceiling was reached
    ContinuationLimit, ///< Multi-output: the extra levels after the first full match are done
    TimeBudget,        ///< The wall-clock budget ran out
    StopRequested      ///< The caller's stop predicate returned true
};

[[nodiscard]] constexpr std::string_view stop_reason_name(StopReason reason) {
    switch (reason) {
    case StopReason::None:
        return "none";
    case StopReason::TargetFound:
        return "target found";
    case StopReason::MaxComplexity:
        return "maximum complexity reached";
    case StopReason::ContinuationLimit:
        return "continuation levels exhausted";
    case StopReason::TimeBudget:
        return "time budget exceeded";
    case StopReason::StopRequested:
        return "stop requested";
    }
    return "unknown";
}

/// Totals over all generated levels of a run
struct SearchStats {
    uint64_t signals_explored = 0;
    uint64_t signals_skipped_by_pruning = 0;
    uint64_t signals_inserted = 0;
    uint64_t duplicates = 0;
    size_t removed_by_cap = 0;
    size_t pool_size = 0;
    std::chrono::milliseconds elapsed{0};
};

/// Owns the state of one search run and advances it level by level.
///
/// The pool is seeded with one leaf per input variable at level 0. Target
/// bit vectors passed at construction are protected from the capacity
/// policy: if a level produces one and the cap drops it, its first
/// derivation is put back.
///
/// The library, inputs and config must outlive the session.
class SearchSession {
  public:
    SearchSession(const GateLibrary& library, const InputSet& inputs, const SearchConfig& config,
                  const std::vector<BitVector>& targets);

    SearchSession(const SearchSession&) = delete;
    SearchSession& operator=(const SearchSession&) = delete;

    /// Extra observer for the driver (runs after the config observer)
    void set_observer(CandidateObserver observer) { driver_observer_ = std::move(observer); }

    /// Generates the next level and emits progress at the configured cadence
    LevelStats advance();

    /// Budget and stop-predicate check, polled between levels
    [[nodiscard]] std::optional<StopReason> interrupted() const;

    [[nodiscard]] const SignalPool& pool() const { return pool_; }
    [[nodiscard]] SearchStats stats() const;

  private:
    void on_candidate(const CandidateEvent& event);
    void emit_progress(int level, const LevelStats* current) const;
    [[nodiscard]] std::chrono::milliseconds elapsed() const;

    const SearchConfig& config_;
    SignalPool pool_;
    PruningPolicy pruning_;
    LevelGenerator generator_;
    CandidateObserver driver_observer_;
    std::unordered_set<BitVector, BitVectorHash> protected_;
    std::vector<std::pair<BitVector, Origin>> pending_;
    SearchStats totals_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace gatesynth

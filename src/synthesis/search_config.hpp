#pragma once

/// @file search_config.hpp
/// @brief Options, progress snapshots and observers shared by both search drivers

#include "synthesis/bit_vector.hpp"
#include "synthesis/signal.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace gatesynth {

/// Telemetry emitted by the drivers at the configured cadence
struct ProgressSnapshot {
    int level = 0;
    uint64_t signals_explored = 0;            ///< Candidates evaluated so far
    uint64_t signals_skipped_by_pruning = 0;  ///< Candidates never evaluated
    size_t pool_size = 0;
    std::chrono::milliseconds elapsed{0};
};

class SignalPool;

/// One evaluated gate application, as seen by a candidate observer
struct CandidateEvent {
    const SignalPool* pool = nullptr;         ///< Pool the candidate was offered to
    int level = 0;
    size_t gate = 0;                          ///< Index into the gate library
    const std::vector<SignalId>* inputs = nullptr;
    const BitVector* bits = nullptr;
    bool is_new = false;                      ///< False if the bits were already in the pool
};

using ProgressCallback = std::function<void(const ProgressSnapshot&)>;
using CandidateObserver = std::function<void(const CandidateEvent&)>;

/// Options recognized by the search drivers
struct SearchConfig {
    /// Hard ceiling on the number of generation passes
    int max_complexity = 10;

    /// Keep at most this many signals per level (lossy, see SignalPool::retain_cheapest)
    std::optional<size_t> pool_cap_per_level;

    /// Multi-output only: extra levels searched after every target first
    /// becomes reachable
    int continuation_levels_after_first_match = 2;

    bool enable_pruning = true;

    /// Multi-output only: derivations remembered per target. Once full, a
    /// cheaper derivation replaces the most expensive one kept.
    size_t max_alternatives_per_target = 32;

    /// Multi-output only: above this many assignments the selection falls back
    /// to coordinate descent
    size_t max_exhaustive_assignments = size_t{1} << 16;

    /// Emit a progress snapshot after every N levels (0 disables)
    int progress_every_levels = 1;

    /// Also emit a snapshot every N evaluated candidates inside a level (0 disables)
    uint64_t progress_every_candidates = 0;

    /// Wall-clock budget polled between levels (zero means unlimited)
    std::chrono::milliseconds time_budget{0};

    ProgressCallback on_progress;

    /// Called for every evaluated candidate (search traces)
    CandidateObserver on_candidate;

    /// Polled between levels; returning true ends the search
    std::function<bool()> stop_requested;
};

/// @throws ConfigurationError for negative levels, a zero pool cap, a zero
///         alternative limit, or a negative progress cadence
void validate(const SearchConfig& config);

/// Converts a wall-clock limit in seconds to a time_budget, rounding up so
/// that any positive limit stays limited (zero still means unlimited)
/// @throws ConfigurationError for a negative or non-finite limit
[[nodiscard]] std::chrono::milliseconds time_budget_from_seconds(double seconds);

} // namespace gatesynth

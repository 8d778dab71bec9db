#pragma once

/// @file single_output_search.hpp
/// @brief Level-by-level search for one target column

#include "synthesis/bit_vector.hpp"
#include "synthesis/gate_library.hpp"
#include "synthesis/input_set.hpp"
#include "synthesis/search_config.hpp"
#include "synthesis/search_session.hpp"
#include "synthesis/signal_pool.hpp"

#include <memory>
#include <optional>

namespace gatesynth {

/// Terminal state of a single-output search
enum class SearchStatus { Found, Exhausted };

struct SingleOutputResult {
    SearchStatus status = SearchStatus::Exhausted;
    std::optional<SignalId> signal; ///< Set when Found
    int level = 0;                  ///< Level of the match, or the last level generated
    double cost = 0.0;              ///< Cost of the found circuit (unique gates)
    StopReason stop_reason = StopReason::None;
    SearchStats stats;

    [[nodiscard]] bool found() const { return status == SearchStatus::Found; }
};

/// Searches for the first signal whose bits equal one target column.
///
/// The search moves through Searching(level) until it reaches Found (the
/// target is in the pool after some level, or is an input) or Exhausted
/// (max_complexity generated without a match, or the caller stopped it).
/// Among several matches at the same level the first discovered wins: gate
/// library order, then combination order.
///
/// The gate library must outlive the search object.
class SingleOutputSearch {
  public:
    /// @throws ConfigurationError if the configuration is invalid
    SingleOutputSearch(const GateLibrary& library, InputSet inputs, SearchConfig config = {});

    /// Runs a fresh search. The returned signal id refers to pool().
    /// @throws ConfigurationError if the target length does not match the inputs
    SingleOutputResult run(const BitVector& target);

    /// Pool of the most recent run
    /// @throws std::logic_error before the first run
    [[nodiscard]] const SignalPool& pool() const;

    [[nodiscard]] const GateLibrary& library() const { return library_; }
    [[nodiscard]] const InputSet& inputs() const { return inputs_; }
    [[nodiscard]] const SearchConfig& config() const { return config_; }

  private:
    const GateLibrary& library_;
    InputSet inputs_;
    SearchConfig config_;
    std::unique_ptr<SearchSession> session_;
};

} // namespace gatesynth

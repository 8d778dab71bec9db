#pragma once

/// @file multi_output_search.hpp
/// @brief Shared-pool search for several target columns at once

#include "synthesis/gate_library.hpp"
#include "synthesis/input_set.hpp"
#include "synthesis/search_config.hpp"
#include "synthesis/search_session.hpp"
#include "synthesis/signal.hpp"
#include "synthesis/signal_pool.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gatesynth {

/// One way of producing a target column: a leaf, or a gate over pool signals
struct Derivation {
    Origin origin;
    int level = 0;                 ///< Level at which it was discovered
    double standalone_cost = 0.0;  ///< Cost of this output built alone
    std::optional<SignalId> signal; ///< The pool signal, when this is its own origin
};

/// The derivation chosen for one output
struct OutputRealization {
    std::string name;
    Derivation derivation;
};

struct MultiOutputResult {
    std::vector<OutputRealization> outputs; ///< Realized outputs, in target order
    std::vector<std::string> missing;       ///< Outputs with no derivation within the ceiling
    double total_cost = 0.0;                ///< Unique-gate cost of all realized outputs together
    int first_full_match_level = -1;        ///< First level where every output was reachable
    int level = 0;                          ///< Last level generated
    size_t assignments_evaluated = 0;
    bool exhaustive_selection = true;       ///< False when coordinate descent was used
    StopReason stop_reason = StopReason::None;
    SearchStats stats;

    [[nodiscard]] bool complete() const { return missing.empty(); }
};

/// Searches one shared pool for several targets so that outputs can reuse
/// each other's intermediate signals.
///
/// Every evaluated candidate is checked against every target, including
/// candidates whose bits were already in the pool, so alternative
/// derivations of a target are remembered (at most
/// max_alternatives_per_target, preferring the cheapest).
/// The search continues continuation_levels_after_first_match levels past
/// the first level where all targets are reachable, then picks one
/// derivation per target minimizing the combined cost, counting each shared
/// signal once.
///
/// The selection only considers derivations discovered during the run. It is
/// a best-effort heuristic, not a guarantee of the globally cheapest circuit.
///
/// The gate library must outlive the search object.
class MultiOutputSearch {
  public:
    /// @throws ConfigurationError if the configuration is invalid
    MultiOutputSearch(const GateLibrary& library, InputSet inputs, SearchConfig config = {});

    /// Runs a fresh search. Signal ids in the result refer to pool().
    /// @throws ConfigurationError if the targets are empty, misnamed or
    ///         have the wrong length
    MultiOutputResult run(const std::vector<NamedColumn>& targets);

    /// Pool of the most recent run
    /// @throws std::logic_error before the first run
    [[nodiscard]] const SignalPool& pool() const;

    /// Combined cost of one derivation per output, shared signals counted once
    [[nodiscard]] double combined_cost(const std::vector<const Derivation*>& chosen) const;

    [[nodiscard]] const GateLibrary& library() const { return library_; }
    [[nodiscard]] const InputSet& inputs() const { return inputs_; }
    [[nodiscard]] const SearchConfig& config() const { return config_; }

  private:
    /// Picks one derivation index per realizable target
    std::vector<size_t> select(const std::vector<std::vector<Derivation>>& candidates,
                               const std::vector<size_t>& realizable, MultiOutputResult& result) const;

    const GateLibrary& library_;
    InputSet inputs_;
    SearchConfig config_;
    std::unique_ptr<SearchSession> session_;
};

} // namespace gatesynth

#pragma once

/// @file search_log.hpp
/// @brief Plain-text search log fed by the drivers' progress and candidate hooks

#include "synthesis/gate_library.hpp"
#include "synthesis/input_set.hpp"
#include "synthesis/multi_output_search.hpp"
#include "synthesis/search_config.hpp"
#include "synthesis/single_output_search.hpp"

#include <cstdio>
#include <string>
#include <vector>

namespace gatesynth {

/// Writes a run log to a caller-owned stream. The stream must stay open for
/// the lifetime of the log; the log never closes it.
///
/// Typical use: header(), then attach(config) before constructing a driver,
/// then single_result() or multi_result() after the run.
class SearchLog {
  public:
    SearchLog(std::FILE* out, bool verbose);

    /// Installs progress (and, when verbose, candidate) hooks on the config.
    /// Hooks already present are still called.
    void attach(SearchConfig& config);

    /// Loaded inputs, targets and gate library
    void header(const std::string& inputs_source, const InputSet& inputs,
                const std::string& targets_source, const std::vector<NamedColumn>& targets,
                const std::string& gates_source, const GateLibrary& library);

    void progress(const ProgressSnapshot& snapshot);

    /// "  Trying: NAND2(A, B) [cost=1] -> 0111"
    void candidate(const CandidateEvent& event);

    void single_result(const std::string& target_name, const SingleOutputResult& result,
                       const SignalPool& pool);
    void multi_result(const MultiOutputResult& result, const SignalPool& pool);

    void error(const std::string& message);

    [[nodiscard]] bool verbose() const { return verbose_; }

  private:
    void rule();
    void stats(const SearchStats& stats);

    std::FILE* out_;
    bool verbose_;
};

} // namespace gatesynth

/// @file search_log.cpp
/// @brief SearchLog formatting

#include "io/search_log.hpp"

#include "io/report.hpp"

#include <utility>

namespace gatesynth {

SearchLog::SearchLog(std::FILE* out, bool verbose) : out_(out), verbose_(verbose) {}

void SearchLog::attach(SearchConfig& config) {
    ProgressCallback previous_progress = std::move(config.on_progress);
    config.on_progress = [this, previous_progress](const ProgressSnapshot& snapshot) {
        progress(snapshot);
        if (previous_progress) {
            previous_progress(snapshot);
        }
    };

    if (!verbose_) {
        return;
    }
    CandidateObserver previous_candidate = std::move(config.on_candidate);
    config.on_candidate = [this, previous_candidate](const CandidateEvent& event) {
        candidate(event);
        if (previous_candidate) {
            previous_candidate(event);
        }
    };
}

void SearchLog::header(const std::string& inputs_source, const InputSet& inputs,
                       const std::string& targets_source, const std::vector<NamedColumn>& targets,
                       const std::string& gates_source, const GateLibrary& library) {
    std::fprintf(out_, "=== gatesynth - level-by-level circuit search ===\n\n");

    std::fprintf(out_, "Inputs from %s (%zu variables, %zu rows):\n", inputs_source.c_str(),
                 inputs.num_vars(), inputs.num_rows());
    for (const NamedColumn& column : inputs.columns()) {
        std::fprintf(out_, "  %s: %s\n", column.name.c_str(), column.bits.to_string().c_str());
    }

    std::fprintf(out_, "\nTargets from %s:\n", targets_source.c_str());
    for (const NamedColumn& column : targets) {
        std::fprintf(out_, "  %s: %s\n", column.name.c_str(), column.bits.to_string().c_str());
    }

    std::fprintf(out_, "\nGates from %s (%zu):", gates_source.c_str(), library.size());
    for (const GateDescriptor& gate : library) {
        std::fprintf(out_, " %s[%s]", gate.name.c_str(), format_cost(gate.cost).c_str());
    }
    std::fprintf(out_, "\n\n");
    rule();
    std::fprintf(out_, "Searching for %zu output(s)\n", targets.size());
    rule();
    std::fflush(out_);
}

void SearchLog::progress(const ProgressSnapshot& snapshot) {
    std::fprintf(out_, "Level %d: %llu explored, %llu skipped by pruning, %zu signals in pool (%lld ms)\n",
                 snapshot.level, static_cast<unsigned long long>(snapshot.signals_explored),
                 static_cast<unsigned long long>(snapshot.signals_skipped_by_pruning),
                 snapshot.pool_size, static_cast<long long>(snapshot.elapsed.count()));
    std::fflush(out_);
}

void SearchLog::candidate(const CandidateEvent& event) {
    const SignalPool& pool = *event.pool;
    const GateDescriptor& gate = pool.library()[event.gate];
    double cost = gate.cost + pool.cone_cost(*event.inputs);
    std::fprintf(out_, "  Trying: %s [cost=%s] -> %s%s\n",
                 render_expression(pool, Origin::derived(event.gate, *event.inputs)).c_str(),
                 format_cost(cost).c_str(), event.bits->to_string().c_str(),
                 event.is_new ? "" : " (known)");
}

void SearchLog::single_result(const std::string& target_name, const SingleOutputResult& result,
                              const SignalPool& pool) {
    std::fprintf(out_, "\n");
    rule();
    if (result.found()) {
        std::fprintf(out_, "=== SOLUTION FOUND at level %d ===\n", result.level);
        std::fprintf(out_, "%s: %s\n", target_name.c_str(),
                     render_expression(pool, *result.signal).c_str());
        std::fprintf(out_, "Cost: %s\n", format_cost(result.cost).c_str());
    } else {
        std::fprintf(out_, "=== NO SOLUTION FOUND (%s after level %d) ===\n",
                     std::string(stop_reason_name(result.stop_reason)).c_str(), result.level);
        std::fprintf(out_, "Try a higher maximum level or more gates.\n");
    }
    stats(result.stats);
    rule();
    std::fflush(out_);
}

void SearchLog::multi_result(const MultiOutputResult& result, const SignalPool& pool) {
    std::fprintf(out_, "\n");
    rule();
    if (result.outputs.empty()) {
        std::fprintf(out_, "=== NO SOLUTION FOUND (%s after level %d) ===\n",
                     std::string(stop_reason_name(result.stop_reason)).c_str(), result.level);
        std::fprintf(out_, "Try a higher maximum level or more gates.\n");
    } else {
        std::fprintf(out_, result.complete() ? "=== SOLUTION FOUND ===\n" : "=== PARTIAL SOLUTION ===\n");
        for (const OutputRealization& output : result.outputs) {
            std::fprintf(out_, "%s: %s [cost=%s, level %d]\n", output.name.c_str(),
                         render_expression(pool, output.derivation.origin).c_str(),
                         format_cost(output.derivation.standalone_cost).c_str(),
                         output.derivation.level);
        }
        for (const std::string& name : result.missing) {
            std::fprintf(out_, "%s: not found\n", name.c_str());
        }
        std::fprintf(out_, "\nCombined cost (shared signals counted once): %s\n",
                     format_cost(result.total_cost).c_str());
        if (result.first_full_match_level >= 0) {
            std::fprintf(out_, "All outputs first reachable at level %d\n", result.first_full_match_level);
        }
        std::fprintf(out_, "Selection: %zu assignments, %s\n", result.assignments_evaluated,
                     result.exhaustive_selection ? "exhaustive" : "coordinate descent");
    }
    std::fprintf(out_, "Stopped: %s after level %d\n",
                 std::string(stop_reason_name(result.stop_reason)).c_str(), result.level);
    stats(result.stats);
    rule();
    std::fflush(out_);
}

void SearchLog::error(const std::string& message) {
    std::fprintf(out_, "\nERROR: %s\n", message.c_str());
    std::fflush(out_);
}

void SearchLog::rule() {
    std::fprintf(out_, "==================================================\n");
}

void SearchLog::stats(const SearchStats& stats) {
    std::fprintf(out_,
                 "Explored %llu candidates (%llu skipped by pruning, %llu duplicates, %zu dropped by cap), "
                 "%zu signals, %lld ms\n",
                 static_cast<unsigned long long>(stats.signals_explored),
                 static_cast<unsigned long long>(stats.signals_skipped_by_pruning),
                 static_cast<unsigned long long>(stats.duplicates), stats.removed_by_cap,
                 stats.pool_size, static_cast<long long>(stats.elapsed.count()));
}

} // namespace gatesynth

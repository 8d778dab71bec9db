/// @file search_session.cpp
/// @brief Level loop plumbing shared by the single- and multi-output drivers

#include "synthesis/search_session.hpp"

namespace gatesynth {

SearchSession::SearchSession(const GateLibrary& library, const InputSet& inputs,
                             const SearchConfig& config, const std::vector<BitVector>& targets)
    : config_(config),
      pool_(library, inputs.num_rows()),
      pruning_(library, inputs.num_rows(), config.enable_pruning),
      generator_(pool_, pruning_),
      protected_(targets.begin(), targets.end()),
      start_(std::chrono::steady_clock::now()) {
    for (const NamedColumn& column : inputs.columns()) {
        (void)pool_.try_insert(column.bits, Origin::leaf(column.name), 0);
    }

    generator_.set_level_cap(config_.pool_cap_per_level);
    generator_.set_observer([this](const CandidateEvent& event) { on_candidate(event); });
    if (config_.progress_every_candidates > 0 && config_.on_progress) {
        generator_.set_tick(config_.progress_every_candidates, [this](const LevelStats& current) {
            emit_progress(current.level, &current);
        });
    }
}

void SearchSession::on_candidate(const CandidateEvent& event) {
    if (config_.pool_cap_per_level && event.is_new && protected_.count(*event.bits) != 0) {
        pending_.emplace_back(*event.bits, Origin::derived(event.gate, *event.inputs));
    }
    if (config_.on_candidate) {
        config_.on_candidate(event);
    }
    if (driver_observer_) {
        driver_observer_(event);
    }
}

LevelStats SearchSession::advance() {
    pending_.clear();
    LevelStats level = generator_.generate_next_level();

    for (auto& [bits, origin] : pending_) {
        if (!pool_.contains(bits)) {
            (void)pool_.try_insert(bits, origin, level.level);
            level.removed_by_cap--;
        }
    }

    totals_.signals_explored += level.candidates_evaluated;
    totals_.signals_skipped_by_pruning += level.skipped_by_pruning;
    totals_.signals_inserted += level.inserted;
    totals_.duplicates += level.duplicates;
    totals_.removed_by_cap += level.removed_by_cap;

    if (config_.progress_every_levels > 0 && level.level % config_.progress_every_levels == 0) {
        emit_progress(level.level, nullptr);
    }
    return level;
}

std::optional<StopReason> SearchSession::interrupted() const {
    if (config_.stop_requested && config_.stop_requested()) {
        return StopReason::StopRequested;
    }
    if (config_.time_budget.count() > 0 && elapsed() >= config_.time_budget) {
        return StopReason::TimeBudget;
    }
    return std::nullopt;
}

SearchStats SearchSession::stats() const {
    SearchStats stats = totals_;
    stats.pool_size = pool_.size();
    stats.elapsed = elapsed();
    return stats;
}

void SearchSession::emit_progress(int level, const LevelStats* current) const {
    if (!config_.on_progress) {
        return;
    }
    ProgressSnapshot snapshot;
    snapshot.level = level;
    snapshot.signals_explored = totals_.signals_explored;
    snapshot.signals_skipped_by_pruning = totals_.signals_skipped_by_pruning;
    if (current != nullptr) {
        snapshot.signals_explored += current->candidates_evaluated;
        snapshot.signals_skipped_by_pruning += current->skipped_by_pruning;
    }
    snapshot.pool_size = pool_.size();
    snapshot.elapsed = elapsed();
    config_.on_progress(snapshot);
}

std::chrono::milliseconds SearchSession::elapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                 start_);
}

} // namespace gatesynth

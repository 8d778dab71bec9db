/// @file level_generator.cpp
/// @brief Frontier-driven enumeration of gate applications for one level

#include "synthesis/level_generator.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace gatesynth {

LevelGenerator::LevelGenerator(SignalPool& pool, const PruningPolicy& pruning)
    : pool_(pool), pruning_(pruning) {}

void LevelGenerator::set_tick(uint64_t every, std::function<void(const LevelStats&)> tick) {
    tick_every_ = every;
    tick_ = std::move(tick);
}

LevelStats LevelGenerator::generate_next_level() {
    if (pool_.size() == 0) {
        throw std::logic_error("Signal pool must be seeded before generating levels");
    }

    LevelStats stats;
    stats.level = pool_.max_level() + 1;

    LevelRange frontier = pool_.level_range(stats.level - 1);
    auto end = static_cast<SignalId>(pool_.size());
    pool_.open_level(stats.level);

    const GateLibrary& library = pool_.library();
    std::vector<SignalId> combo;

    for (size_t g = 0; g < library.size(); g++) {
        auto k = static_cast<size_t>(library[g].arity);
        combo.assign(k, 0);

        for (SignalId largest = frontier.begin; largest < end; largest++) {
            combo[k - 1] = largest;
            std::fill(combo.begin(), combo.end() - 1, 0);

            while (true) {
                visit(g, combo, stats);

                // Advance the prefix odometer, keeping it non-decreasing and <= largest.
                int i = static_cast<int>(k) - 2;
                while (i >= 0 && combo[i] == largest) {
                    i--;
                }
                if (i < 0) {
                    break;
                }
                combo[i]++;
                for (size_t j = i + 1; j + 1 < k; j++) {
                    combo[j] = combo[i];
                }
            }
        }
    }

    if (cap_) {
        stats.removed_by_cap = pool_.retain_cheapest(stats.level, *cap_);
    }
    return stats;
}

void LevelGenerator::visit(size_t gate_index, const std::vector<SignalId>& inputs, LevelStats& stats) {
    const GateDescriptor& gate = pool_.library()[gate_index];

    if (pruning_.should_skip(gate, inputs, pool_)) {
        stats.skipped_by_pruning++;
        return;
    }

    columns_.clear();
    for (SignalId id : inputs) {
        columns_.push_back(&pool_[id].bits);
    }
    BitVector bits = evaluate_gate(gate, columns_);
    stats.candidates_evaluated++;

    InsertResult result = pool_.try_insert(std::move(bits), Origin::derived(gate_index, inputs),
                                           stats.level);
    if (result.is_new) {
        stats.inserted++;
    } else {
        stats.duplicates++;
    }

    if (observer_) {
        CandidateEvent event;
        event.pool = &pool_;
        event.level = stats.level;
        event.gate = gate_index;
        event.inputs = &inputs;
        event.bits = &pool_[result.id].bits; // equal bits whether new or not
        event.is_new = result.is_new;
        observer_(event);
    }

    if (tick_ && tick_every_ > 0 && stats.candidates_evaluated % tick_every_ == 0) {
        tick_(stats);
    }
}

} // namespace gatesynth

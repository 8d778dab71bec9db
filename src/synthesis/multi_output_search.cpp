/// @file multi_output_search.cpp
/// @brief Multi-output driver: shared generation, derivation tracking, cost selection

#include "synthesis/multi_output_search.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace gatesynth {

MultiOutputSearch::MultiOutputSearch(const GateLibrary& library, InputSet inputs, SearchConfig config)
    : library_(library), inputs_(std::move(inputs)), config_(std::move(config)) {
    validate(config_);
}

const SignalPool& MultiOutputSearch::pool() const {
    if (!session_) {
        throw std::logic_error("No search has been run yet");
    }
    return session_->pool();
}

MultiOutputResult MultiOutputSearch::run(const std::vector<NamedColumn>& targets) {
    inputs_.check_targets(targets);

    std::vector<BitVector> target_bits;
    std::unordered_map<BitVector, std::vector<size_t>, BitVectorHash> by_bits;
    for (size_t t = 0; t < targets.size(); t++) {
        target_bits.push_back(targets[t].bits);
        by_bits[targets[t].bits].push_back(t);
    }

    session_ = std::make_unique<SearchSession>(library_, inputs_, config_, target_bits);
    const SignalPool& pool = session_->pool();

    std::vector<std::vector<Derivation>> candidates(targets.size());
    auto price = [&](const Origin& origin) {
        if (origin.is_leaf()) {
            return 0.0;
        }
        return library_[*origin.gate].cost + pool.cone_cost(origin.inputs);
    };

    // A full list trades its most expensive entry for a cheaper newcomer
    auto record = [&](size_t t, const Origin& origin, int level) {
        std::vector<Derivation>& list = candidates[t];
        for (const Derivation& known : list) {
            if (known.origin == origin) {
                return;
            }
        }
        Derivation derivation;
        derivation.origin = origin;
        derivation.level = level;
        derivation.standalone_cost = price(origin);
        if (list.size() < config_.max_alternatives_per_target) {
            list.push_back(std::move(derivation));
            return;
        }
        auto worst = std::max_element(list.begin(), list.end(),
                                      [](const Derivation& a, const Derivation& b) {
                                          return a.standalone_cost < b.standalone_cost;
                                      });
        if (worst != list.end() && derivation.standalone_cost < worst->standalone_cost) {
            *worst = std::move(derivation);
        }
    };

    // Inputs that already equal a target
    LevelRange leaves = pool.level_range(0);
    for (SignalId id = leaves.begin; id < leaves.end; id++) {
        if (auto it = by_bits.find(pool[id].bits); it != by_bits.end()) {
            for (size_t t : it->second) {
                record(t, pool[id].origin, 0);
            }
        }
    }

    session_->set_observer([&](const CandidateEvent& event) {
        auto it = by_bits.find(*event.bits);
        if (it == by_bits.end()) {
            return;
        }
        Origin origin = Origin::derived(event.gate, *event.inputs);
        for (size_t t : it->second) {
            record(t, origin, event.level);
        }
    });

    auto all_reachable = [&]() {
        return std::all_of(candidates.begin(), candidates.end(),
                           [](const std::vector<Derivation>& list) { return !list.empty(); });
    };

    MultiOutputResult result;
    if (all_reachable()) {
        result.first_full_match_level = 0;
    }

    while (true) {
        if (result.first_full_match_level >= 0 &&
            result.level >= result.first_full_match_level + config_.continuation_levels_after_first_match) {
            result.stop_reason = StopReason::ContinuationLimit;
            break;
        }
        if (result.level >= config_.max_complexity) {
            result.stop_reason = StopReason::MaxComplexity;
            break;
        }
        if (auto reason = session_->interrupted()) {
            result.stop_reason = *reason;
            break;
        }

        LevelStats level = session_->advance();
        result.level = level.level;

        if (result.first_full_match_level < 0 && all_reachable()) {
            result.first_full_match_level = level.level;
        }
    }
    session_->set_observer(nullptr);

    // Price every derivation and tie it to its pool signal where it is one.
    std::vector<size_t> realizable;
    for (size_t t = 0; t < targets.size(); t++) {
        std::optional<SignalId> pooled = pool.find(targets[t].bits);
        for (Derivation& derivation : candidates[t]) {
            if (pooled && pool[*pooled].origin == derivation.origin) {
                derivation.signal = pooled;
            }
            derivation.standalone_cost = price(derivation.origin);
        }
        std::stable_sort(candidates[t].begin(), candidates[t].end(),
                         [](const Derivation& a, const Derivation& b) {
                             return a.standalone_cost < b.standalone_cost;
                         });

        if (candidates[t].empty()) {
            result.missing.push_back(targets[t].name);
        } else {
            realizable.push_back(t);
        }
    }

    std::vector<size_t> choice = select(candidates, realizable, result);

    std::vector<const Derivation*> chosen;
    for (size_t k = 0; k < realizable.size(); k++) {
        size_t t = realizable[k];
        result.outputs.push_back({targets[t].name, candidates[t][choice[k]]});
        chosen.push_back(&candidates[t][choice[k]]);
    }
    result.total_cost = combined_cost(chosen);
    result.stats = session_->stats();
    return result;
}

double MultiOutputSearch::combined_cost(const std::vector<const Derivation*>& chosen) const {
    const SignalPool& signals = pool();

    std::vector<SignalId> roots;
    std::vector<const Origin*> separate;
    double cost = 0.0;

    for (const Derivation* derivation : chosen) {
        if (derivation->signal) {
            roots.push_back(*derivation->signal);
            continue;
        }
        if (derivation->origin.is_leaf()) {
            continue;
        }
        bool seen = std::any_of(separate.begin(), separate.end(),
                                [&](const Origin* other) { return *other == derivation->origin; });
        if (seen) {
            continue;
        }
        separate.push_back(&derivation->origin);
        cost += library_[*derivation->origin.gate].cost;
        roots.insert(roots.end(), derivation->origin.inputs.begin(), derivation->origin.inputs.end());
    }

    return cost + signals.cone_cost(roots);
}

std::vector<size_t> MultiOutputSearch::select(const std::vector<std::vector<Derivation>>& candidates,
                                              const std::vector<size_t>& realizable,
                                              MultiOutputResult& result) const {
    size_t n = realizable.size();
    std::vector<size_t> choice(n, 0);
    if (n == 0) {
        return choice;
    }

    bool exhaustive = true;
    size_t product = 1;
    for (size_t t : realizable) {
        size_t options = candidates[t].size();
        if (product > std::numeric_limits<size_t>::max() / options) {
            exhaustive = false;
            break;
        }
        product *= options;
    }
    if (product > config_.max_exhaustive_assignments) {
        exhaustive = false;
    }
    result.exhaustive_selection = exhaustive;

    std::vector<const Derivation*> chosen(n);
    auto cost_of = [&](const std::vector<size_t>& assignment) {
        for (size_t k = 0; k < n; k++) {
            chosen[k] = &candidates[realizable[k]][assignment[k]];
        }
        result.assignments_evaluated++;
        return combined_cost(chosen);
    };

    double best_cost = cost_of(choice);

    if (exhaustive) {
        std::vector<size_t> current(n, 0);
        std::vector<size_t> best = current;
        while (true) {
            // Odometer over the assignment space, last output fastest
            int k = static_cast<int>(n) - 1;
            while (k >= 0) {
                current[k]++;
                if (current[k] < candidates[realizable[k]].size()) {
                    break;
                }
                current[k] = 0;
                k--;
            }
            if (k < 0) {
                break;
            }
            double cost = cost_of(current);
            if (cost < best_cost) {
                best_cost = cost;
                best = current;
            }
        }
        return best;
    }

    // Coordinate descent from the individually cheapest derivations
    bool improved = true;
    while (improved) {
        improved = false;
        for (size_t k = 0; k < n; k++) {
            for (size_t i = 0; i < candidates[realizable[k]].size(); i++) {
                if (i == choice[k]) {
                    continue;
                }
                std::vector<size_t> trial = choice;
                trial[k] = i;
                double cost = cost_of(trial);
                if (cost < best_cost) {
                    best_cost = cost;
                    choice = std::move(trial);
                    improved = true;
                }
            }
        }
    }
    return choice;
}

} // namespace gatesynth

/// @file signal_pool.cpp
/// @brief Signal pool insertion, deduplication, cone traversal and capacity policy

#include "synthesis/signal_pool.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace gatesynth {

SignalPool::SignalPool(const GateLibrary& library, size_t num_rows)
    : library_(&library), num_rows_(num_rows) {}

void SignalPool::open_level(int level) {
    if (level < 0) {
        throw std::invalid_argument("Signal levels cannot be negative");
    }
    while (max_level() < level) {
        level_begin_.push_back(static_cast<SignalId>(signals_.size()));
    }
}

InsertResult SignalPool::try_insert(BitVector bits, Origin origin, int level) {
    if (bits.size() != num_rows_) {
        throw std::invalid_argument("Signal has " + std::to_string(bits.size()) +
                                    " rows, pool expects " + std::to_string(num_rows_));
    }
    if (level < max_level()) {
        throw std::invalid_argument("Cannot insert at level " + std::to_string(level) +
                                    " after level " + std::to_string(max_level()) + " was opened");
    }

    double own_cost = 0.0;
    if (!origin.is_leaf()) {
        if (*origin.gate >= library_->size()) {
            throw std::invalid_argument("Derived signal references an unknown gate");
        }
        const GateDescriptor& gate = (*library_)[*origin.gate];
        if (static_cast<int>(origin.inputs.size()) != gate.arity) {
            throw std::invalid_argument("Derived signal has the wrong number of inputs for " +
                                        gate.name);
        }
        for (SignalId input : origin.inputs) {
            if (input >= signals_.size() || signals_[input].level >= level) {
                throw std::invalid_argument(
                    "Derived signal inputs must be existing signals of an earlier level");
            }
        }
        own_cost = gate.cost;
    }

    if (auto it = index_.find(bits); it != index_.end()) {
        return {it->second, false};
    }

    open_level(level);

    auto id = static_cast<SignalId>(signals_.size());
    index_.emplace(bits, id);

    Signal signal;
    signal.id = id;
    signal.bits = std::move(bits);
    signal.origin = std::move(origin);
    signal.level = level;
    signal.own_cost = own_cost;
    signals_.push_back(std::move(signal));

    return {id, true};
}

const Signal& SignalPool::at(SignalId id) const {
    if (id >= signals_.size()) {
        throw std::out_of_range("Signal id " + std::to_string(id) + " is not in the pool");
    }
    return signals_[id];
}

std::optional<SignalId> SignalPool::find(const BitVector& bits) const {
    auto it = index_.find(bits);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

LevelRange SignalPool::level_range(int level) const {
    if (level < 0 || level > max_level()) {
        auto end = static_cast<SignalId>(signals_.size());
        return {end, end};
    }
    SignalId begin = level_begin_[level];
    SignalId end = level == max_level() ? static_cast<SignalId>(signals_.size())
                                        : level_begin_[level + 1];
    return {begin, end};
}

std::vector<SignalId> SignalPool::cone(const std::vector<SignalId>& roots) const {
    std::vector<bool> visited(signals_.size(), false);
    std::vector<SignalId> stack;
    std::vector<SignalId> result;

    for (SignalId root : roots) {
        stack.push_back(at(root).id);
    }
    while (!stack.empty()) {
        SignalId id = stack.back();
        stack.pop_back();
        if (visited[id]) {
            continue;
        }
        visited[id] = true;
        result.push_back(id);
        for (SignalId input : signals_[id].origin.inputs) {
            stack.push_back(input);
        }
    }

    std::sort(result.begin(), result.end());
    return result;
}

double SignalPool::cone_cost(const std::vector<SignalId>& roots) const {
    double cost = 0.0;
    for (SignalId id : cone(roots)) {
        cost += signals_[id].own_cost;
    }
    return cost;
}

BitVector SignalPool::recompute(SignalId id) const {
    const Signal& signal = at(id);
    if (signal.origin.is_leaf()) {
        return signal.bits;
    }
    std::vector<const BitVector*> inputs;
    for (SignalId input : signal.origin.inputs) {
        inputs.push_back(&signals_[input].bits);
    }
    return evaluate_gate((*library_)[*signal.origin.gate], inputs);
}

std::vector<BitVector> SignalPool::recompute_all() const {
    std::vector<BitVector> recomputed;
    recomputed.reserve(signals_.size());

    std::vector<const BitVector*> inputs;
    for (const Signal& signal : signals_) {
        if (signal.origin.is_leaf()) {
            recomputed.push_back(signal.bits);
            continue;
        }
        inputs.clear();
        for (SignalId input : signal.origin.inputs) {
            inputs.push_back(&recomputed[input]);
        }
        recomputed.push_back(evaluate_gate((*library_)[*signal.origin.gate], inputs));
    }
    return recomputed;
}

size_t SignalPool::retain_cheapest(int level, size_t cap) {
    if (level != max_level()) {
        throw std::invalid_argument("Capacity policy applies to the newest level only");
    }
    LevelRange range = level_range(level);
    if (range.size() <= cap) {
        return 0;
    }

    std::vector<std::pair<double, SignalId>> ranked;
    ranked.reserve(range.size());
    for (SignalId id = range.begin; id < range.end; id++) {
        ranked.emplace_back(cone_cost({id}), id);
    }
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<bool> keep(range.size(), false);
    for (size_t i = 0; i < cap; i++) {
        keep[ranked[i].second - range.begin] = true;
    }

    // Nothing references the newest level yet, so its tail can be rebuilt.
    std::vector<Signal> kept;
    kept.reserve(cap);
    for (SignalId id = range.begin; id < range.end; id++) {
        if (keep[id - range.begin]) {
            kept.push_back(std::move(signals_[id]));
        } else {
            index_.erase(signals_[id].bits);
        }
    }
    while (signals_.size() > range.begin) {
        signals_.pop_back();
    }
    for (Signal& signal : kept) {
        signal.id = static_cast<SignalId>(signals_.size());
        index_.find(signal.bits)->second = signal.id;
        signals_.push_back(std::move(signal));
    }

    return range.size() - cap;
}

} // namespace gatesynth

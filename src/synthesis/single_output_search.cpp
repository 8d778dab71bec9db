/// @file single_output_search.cpp
/// @brief Single-output driver state machine

#include "synthesis/single_output_search.hpp"

#include <stdexcept>
#include <utility>

namespace gatesynth {

SingleOutputSearch::SingleOutputSearch(const GateLibrary& library, InputSet inputs,
                                       SearchConfig config)
    : library_(library), inputs_(std::move(inputs)), config_(std::move(config)) {
    validate(config_);
}

const SignalPool& SingleOutputSearch::pool() const {
    if (!session_) {
        throw std::logic_error("No search has been run yet");
    }
    return session_->pool();
}

SingleOutputResult SingleOutputSearch::run(const BitVector& target) {
    inputs_.check_target("target", target);

    session_ = std::make_unique<SearchSession>(library_, inputs_, config_,
                                               std::vector<BitVector>{target});
    const SignalPool& pool = session_->pool();

    SingleOutputResult result;
    auto finish_found = [&](SignalId id) {
        result.status = SearchStatus::Found;
        result.signal = id;
        result.cost = pool.cone_cost({id});
        result.stop_reason = StopReason::TargetFound;
    };

    if (auto id = pool.find(target)) {
        finish_found(*id);
    }

    while (!result.found()) {
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

        if (auto id = pool.find(target)) {
            finish_found(*id);
        }
    }

    result.stats = session_->stats();
    return result;
}

} // namespace gatesynth

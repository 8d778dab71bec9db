/// @file search_config.cpp
/// @brief Validation of search options

#include "synthesis/search_config.hpp"

#include "synthesis/errors.hpp"

#include <cmath>

namespace gatesynth {

void validate(const SearchConfig& config) {
    if (config.max_complexity < 0) {
        throw ConfigurationError("max_complexity must not be negative");
    }
    if (config.pool_cap_per_level && *config.pool_cap_per_level == 0) {
        throw ConfigurationError("pool_cap_per_level must be at least 1 when set");
    }
    if (config.continuation_levels_after_first_match < 0) {
        throw ConfigurationError("continuation_levels_after_first_match must not be negative");
    }
    if (config.max_alternatives_per_target == 0) {
        throw ConfigurationError("max_alternatives_per_target must be at least 1");
    }
    if (config.max_exhaustive_assignments == 0) {
        throw ConfigurationError("max_exhaustive_assignments must be at least 1");
    }
    if (config.progress_every_levels < 0) {
        throw ConfigurationError("progress_every_levels must not be negative");
    }
    if (config.time_budget.count() < 0) {
        throw ConfigurationError("time_budget must not be negative");
    }
}

std::chrono::milliseconds time_budget_from_seconds(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0.0) {
        throw ConfigurationError("Time limit must be a finite, non-negative number of seconds");
    }
    return std::chrono::milliseconds(static_cast<long long>(std::ceil(seconds * 1000.0)));
}

} // namespace gatesynth

#pragma once

/// @file errors.hpp
/// @brief Exception raised for invalid search setups

#include <stdexcept>
#include <string>

namespace gatesynth {

/// Raised when a gate library, input table, target table or search
/// configuration is malformed. Always thrown before a search starts; the
/// engine never recovers from it.
class ConfigurationError : public std::invalid_argument {
  public:
    explicit ConfigurationError(const std::string& message) : std::invalid_argument(message) {}
};

} // namespace gatesynth

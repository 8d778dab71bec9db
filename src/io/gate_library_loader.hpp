#pragma once

/// @file gate_library_loader.hpp
/// @brief Reads gate libraries from gate_name,num_inputs,complexity tables

#include "synthesis/gate_library.hpp"

#include <iosfwd>
#include <string>

namespace gatesynth {

/// Parses a gate table. The first non-blank line is the header; blank lines
/// and lines starting with '#' are skipped. Each row is
/// `name,num_inputs,cost`; the name fixes family and arity, and the
/// num_inputs column must agree with it.
/// @param source Name used in error messages (usually the file path)
/// @throws ConfigurationError for short rows, unknown gates, arity
///         mismatches, unparsable numbers, or an invalid resulting library
[[nodiscard]] GateLibrary parse_gate_library_csv(std::istream& in, const std::string& source);

/// @throws std::runtime_error if the file cannot be opened
/// @throws ConfigurationError as for parse_gate_library_csv
[[nodiscard]] GateLibrary load_gate_library_csv(const std::string& path);

} // namespace gatesynth

#pragma once

/// @file csv_table.hpp
/// @brief Reading and writing 0/1 truth tables as CSV

#include "synthesis/input_set.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace gatesynth {

/// Parses a truth table: a header of column names, then one row of 0/1
/// cells per line. Blank lines are ignored.
/// @param source Name used in error messages (usually the file path)
/// @throws ConfigurationError for a missing header, an empty or repeated
///         column name, a ragged row, or a cell other than 0 or 1
[[nodiscard]] std::vector<NamedColumn> parse_truth_table_csv(std::istream& in,
                                                             const std::string& source);

/// @throws std::runtime_error if the file cannot be opened
/// @throws ConfigurationError as for parse_truth_table_csv
[[nodiscard]] std::vector<NamedColumn> read_truth_table_csv(const std::string& path);

/// Writes columns of equal length in the same format
/// @throws std::invalid_argument if the columns differ in length
void write_truth_table_csv(std::ostream& out, const std::vector<NamedColumn>& columns);

/// @throws std::runtime_error if the file cannot be written
void write_truth_table_csv(const std::string& path, const std::vector<NamedColumn>& columns);

} // namespace gatesynth

#pragma once

/// @file input_set.hpp
/// @brief Validated input variables and target columns of a search

#include "synthesis/bit_vector.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace gatesynth {

/// Largest number of input variables a search accepts
constexpr size_t MAX_INPUT_VARIABLES = 16;

/// A named truth-table column (an input variable or a target output)
struct NamedColumn {
    std::string name;
    BitVector bits;
};

/// The ordered input variables of a search.
///
/// Every column has 2^num_vars rows and all rows are aligned across
/// variables. The columns need not follow the canonical row order; the
/// search only relies on row alignment.
class InputSet {
  public:
    /// @throws ConfigurationError if there are no variables, more than
    ///         MAX_INPUT_VARIABLES, an empty or repeated name, or a column
    ///         whose length is not 2^num_vars
    explicit InputSet(std::vector<NamedColumn> columns);

    /// The canonical input table: variable 0 is the most significant bit of
    /// the row number. Names default to A, B, C, ...
    /// @throws ConfigurationError as for the constructor, or if the number
    ///         of names does not match num_vars
    [[nodiscard]] static InputSet canonical(size_t num_vars, std::vector<std::string> names = {});

    [[nodiscard]] size_t num_vars() const { return columns_.size(); }
    [[nodiscard]] size_t num_rows() const { return row_count(columns_.size()); }
    [[nodiscard]] const std::vector<NamedColumn>& columns() const { return columns_; }

    /// Checks a target column against this input set.
    /// @throws ConfigurationError if its length is not num_rows()
    void check_target(const std::string& name, const BitVector& bits) const;

    /// Checks a list of targets: non-empty, unique non-empty names, lengths.
    /// @throws ConfigurationError on the first problem found
    void check_targets(const std::vector<NamedColumn>& targets) const;

  private:
    std::vector<NamedColumn> columns_;
};

} // namespace gatesynth

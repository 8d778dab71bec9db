#pragma once

/// @file bit_vector.hpp
/// @brief Packed truth-table column, one bit per input row

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace gatesynth {

/// A truth-table column stored 64 rows per word. Row r lives in bit (r % 64)
/// of word (r / 64). Bits past size() in the last word are always zero, so
/// word-wise comparison and hashing are exact.
///
/// Equality of two bit vectors is the identity of a signal: the search never
/// compares expressions, only columns.
class BitVector {
  public:
    BitVector() = default;

    /// Creates an all-zero column of the given length
    explicit BitVector(size_t num_bits);

    /// Creates a column from one bool per row
    [[nodiscard]] static BitVector from_bools(const std::vector<bool>& bits);

    /// Parses "0110"-style text, row 0 first.
    /// @throws std::invalid_argument on characters other than '0' and '1'
    [[nodiscard]] static BitVector from_string(std::string_view text);

    /// Creates a column holding the same value in every row
    [[nodiscard]] static BitVector constant(size_t num_bits, bool value);

    [[nodiscard]] size_t size() const { return size_; }
    [[nodiscard]] bool empty() const { return size_ == 0; }
    [[nodiscard]] size_t num_words() const { return words_.size(); }
    [[nodiscard]] uint64_t word(size_t index) const { return words_[index]; }
    [[nodiscard]] const std::vector<uint64_t>& words() const { return words_; }

    /// Stores a whole word; bits past size() are cleared
    void set_word(size_t index, uint64_t value);

    /// @throws std::out_of_range if row >= size()
    [[nodiscard]] bool get(size_t row) const;

    /// @throws std::out_of_range if row >= size()
    void set(size_t row, bool value);

    /// Number of rows that are 1
    [[nodiscard]] size_t count_ones() const;

    /// Bitwise complement (stays within size())
    [[nodiscard]] BitVector operator~() const;

    /// Renders the column as "0110", row 0 first
    [[nodiscard]] std::string to_string() const;

    /// One bool per row
    [[nodiscard]] std::vector<bool> to_bools() const;

    [[nodiscard]] size_t hash() const;

    bool operator==(const BitVector& other) const {
        return size_ == other.size_ && words_ == other.words_;
    }
    bool operator!=(const BitVector& other) const { return !(*this == other); }

  private:
    /// Mask of the valid bits in the last word
    [[nodiscard]] uint64_t tail_mask() const;

    size_t size_ = 0;
    std::vector<uint64_t> words_;
};

/// Hash functor for unordered containers keyed by BitVector
struct BitVectorHash {
    size_t operator()(const BitVector& bits) const { return bits.hash(); }
};

/// Number of rows of a complete truth table over num_vars variables
[[nodiscard]] constexpr size_t row_count(size_t num_vars) {
    return size_t{1} << num_vars;
}

/// The column of input variable var_index in the canonical row ordering:
/// variable 0 is the most significant bit of the row number, so for two
/// variables A = 0011 and B = 0101.
/// @throws std::invalid_argument if var_index >= num_vars
[[nodiscard]] BitVector input_column(size_t num_vars, size_t var_index);

} // namespace gatesynth

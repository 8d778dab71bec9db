/// @file bit_vector.cpp
/// @brief BitVector storage, conversion and hashing

#include "synthesis/bit_vector.hpp"

#include <stdexcept>

namespace gatesynth {

namespace {

constexpr size_t WORD_BITS = 64;

size_t words_for(size_t num_bits) {
    return (num_bits + WORD_BITS - 1) / WORD_BITS;
}

} // namespace

BitVector::BitVector(size_t num_bits) : size_(num_bits), words_(words_for(num_bits), 0) {}

BitVector BitVector::from_bools(const std::vector<bool>& bits) {
    BitVector result(bits.size());
    for (size_t row = 0; row < bits.size(); row++) {
        if (bits[row]) {
            result.words_[row / WORD_BITS] |= uint64_t{1} << (row % WORD_BITS);
        }
    }
    return result;
}

BitVector BitVector::from_string(std::string_view text) {
    BitVector result(text.size());
    for (size_t row = 0; row < text.size(); row++) {
        if (text[row] == '1') {
            result.words_[row / WORD_BITS] |= uint64_t{1} << (row % WORD_BITS);
        } else if (text[row] != '0') {
            throw std::invalid_argument("Bit vector text may only contain '0' and '1': " +
                                        std::string(text));
        }
    }
    return result;
}

BitVector BitVector::constant(size_t num_bits, bool value) {
    BitVector result(num_bits);
    if (value) {
        for (size_t i = 0; i < result.words_.size(); i++) {
            result.set_word(i, ~uint64_t{0});
        }
    }
    return result;
}

uint64_t BitVector::tail_mask() const {
    size_t used = size_ % WORD_BITS;
    return used == 0 ? ~uint64_t{0} : (uint64_t{1} << used) - 1;
}

void BitVector::set_word(size_t index, uint64_t value) {
    if (index >= words_.size()) {
        throw std::out_of_range("Bit vector word index out of range");
    }
    if (index + 1 == words_.size()) {
        value &= tail_mask();
    }
    words_[index] = value;
}

bool BitVector::get(size_t row) const {
    if (row >= size_) {
        throw std::out_of_range("Bit vector row out of range");
    }
    return (words_[row / WORD_BITS] >> (row % WORD_BITS)) & 1;
}

void BitVector::set(size_t row, bool value) {
    if (row >= size_) {
        throw std::out_of_range("Bit vector row out of range");
    }
    uint64_t mask = uint64_t{1} << (row % WORD_BITS);
    if (value) {
        words_[row / WORD_BITS] |= mask;
    } else {
        words_[row / WORD_BITS] &= ~mask;
    }
}

size_t BitVector::count_ones() const {
    size_t count = 0;
    for (uint64_t w : words_) {
        while (w != 0) {
            w &= w - 1;
            count++;
        }
    }
    return count;
}

BitVector BitVector::operator~() const {
    BitVector result(size_);
    for (size_t i = 0; i < words_.size(); i++) {
        result.set_word(i, ~words_[i]);
    }
    return result;
}

std::string BitVector::to_string() const {
    std::string text;
    text.reserve(size_);
    for (size_t row = 0; row < size_; row++) {
        text.push_back(get(row) ? '1' : '0');
    }
    return text;
}

std::vector<bool> BitVector::to_bools() const {
    std::vector<bool> bits(size_);
    for (size_t row = 0; row < size_; row++) {
        bits[row] = get(row);
    }
    return bits;
}

size_t BitVector::hash() const {
    // 64-bit FNV-1a over the words, seeded with the length
    uint64_t h = 1469598103934665603ULL ^ size_;
    for (uint64_t w : words_) {
        for (int shift = 0; shift < 64; shift += 8) {
            h ^= (w >> shift) & 0xFF;
            h *= 1099511628211ULL;
        }
    }
    return static_cast<size_t>(h);
}

BitVector input_column(size_t num_vars, size_t var_index) {
    if (var_index >= num_vars) {
        throw std::invalid_argument("Input variable index out of range");
    }
    size_t rows = row_count(num_vars);
    size_t bit_position = num_vars - 1 - var_index;
    BitVector column(rows);
    for (size_t row = 0; row < rows; row++) {
        if ((row >> bit_position) & 1) {
            column.set(row, true);
        }
    }
    return column;
}

} // namespace gatesynth

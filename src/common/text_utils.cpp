/// @file text_utils.cpp
/// @brief String helpers

#include "common/text_utils.hpp"

#include <cctype>

namespace gatesynth {

std::string_view trim(std::string_view text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        begin++;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        end--;
    }
    return text.substr(begin, end - begin);
}

std::vector<std::string> split_fields(std::string_view text, char delimiter) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
        size_t pos = text.find(delimiter, start);
        fields.emplace_back(trim(text.substr(start, pos == std::string_view::npos ? pos : pos - start)));
        if (pos == std::string_view::npos) {
            break;
        }
        start = pos + 1;
    }
    return fields;
}

std::string to_upper(std::string_view text) {
    std::string upper;
    upper.reserve(text.size());
    for (char c : text) {
        upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return upper;
}

} // namespace gatesynth

#pragma once

/// @file text_utils.hpp
/// @brief Small string helpers shared by the table and expression readers

#include <string>
#include <string_view>
#include <vector>

namespace gatesynth {

/// Strips leading and trailing whitespace (including '\r')
[[nodiscard]] std::string_view trim(std::string_view text);

/// Splits on a delimiter and trims every field
[[nodiscard]] std::vector<std::string> split_fields(std::string_view text, char delimiter);

/// ASCII upper-case copy
[[nodiscard]] std::string to_upper(std::string_view text);

} // namespace gatesynth

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace word_splitter {

inline constexpr const char* DEFAULT_IFS = " \t\n";

// Splits text on IFS. An unset IFS behaves as " \t\n"; an empty IFS disables splitting.
// Whitespace separators collapse and are trimmed at the ends; every other separator
// delimits exactly one field, so adjacent ones yield empty fields.
std::vector<std::string> word_split(const std::string& text, const std::optional<std::string>& ifs);

bool is_ifs_whitespace(char c);

}  // namespace word_splitter

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace thai {

// True if the token holds any character outside U+0E00-U+0E7F
// (punctuation, whitespace, Latin, digits, invalid bytes).
bool is_hard_boundary(std::string_view token);

// Whether tokens [start, end) may form one span. Singletons always may.
bool can_span(const std::vector<std::string>& tokens, size_t start, size_t end);

} // namespace thai

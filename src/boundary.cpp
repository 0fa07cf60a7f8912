#include "boundary.hpp"
#include "constants.hpp"

namespace thai {

bool is_hard_boundary(std::string_view token) {
    size_t i = 0;
    while (i < token.length()) {
        auto [cp, len] = get_char_at(token, i);
        if (len == 0 || !is_thai_char(cp)) return true;
        i += len;
    }
    return false;
}

bool can_span(const std::vector<std::string>& tokens, size_t start, size_t end) {
    if (end - start <= 1) return true;
    for (size_t k = start; k < end; ++k) {
        if (is_hard_boundary(tokens[k])) return false;
    }
    return true;
}

} // namespace thai

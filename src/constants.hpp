#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace thai {

// Thai Unicode block
constexpr char32_t THAI_START = 0x0E00;
constexpr char32_t THAI_END = 0x0E7F;

// Storage key namespaces
constexpr const char* MERGES_KEY_PREFIX = "thai_merges_";
constexpr const char* LINE_KEY_PREFIX = "thai_seg_line_";

// Hard limits on the per-video merge set
constexpr size_t MIN_MERGE_CAP = 100;
constexpr size_t MAX_MERGE_CAP = 20000;

// Upper bounds for configured values; keep arithmetic on them in range
constexpr size_t MAX_CONFIG_COUNT = 1000000;
constexpr int64_t MAX_TTL_SECONDS = 10LL * 365 * 24 * 60 * 60;
constexpr int64_t MAX_COOLDOWN_MINUTES = 365LL * 24 * 60;

inline bool is_thai_char(char32_t c) {
    return c >= THAI_START && c <= THAI_END;
}

// Zero-width space / non-joiner / joiner (U+200B-U+200D)
// and variation selectors (U+FE00-U+FE0F)
inline bool is_invisible_mark(char32_t c) {
    return (c >= 0x200B && c <= 0x200D) || (c >= 0xFE00 && c <= 0xFE0F);
}

inline bool is_trim_space(char32_t c) {
    switch (c) {
        case ' ': case '\t': case '\n': case '\r': case '\v': case '\f':
        case 0x00A0: // no-break space
        case 0x1680:
        case 0x2028: case 0x2029:
        case 0x202F: case 0x205F:
        case 0x3000:
        case 0xFEFF: // BOM
            return true;
        default:
            return (c >= 0x2000 && c <= 0x200A);
    }
}

// UTF-8 Helper: Get code point and length from string at index
inline std::pair<char32_t, int> get_char_at(std::string_view text, size_t index) {
    if (index >= text.length()) return {0, 0};

    unsigned char c = static_cast<unsigned char>(text[index]);
    if (c < 0x80) return {c, 1};

    if ((c & 0xE0) == 0xC0) {
        if (index + 1 >= text.length()) return {0, 0};
        return {
            ((c & 0x1F) << 6) | (static_cast<unsigned char>(text[index + 1]) & 0x3F),
            2
        };
    }

    if ((c & 0xF0) == 0xE0) {
        if (index + 2 >= text.length()) return {0, 0};
        return {
            ((c & 0x0F) << 12) |
            ((static_cast<unsigned char>(text[index + 1]) & 0x3F) << 6) |
            (static_cast<unsigned char>(text[index + 2]) & 0x3F),
            3
        };
    }

    if ((c & 0xF8) == 0xF0) {
        if (index + 3 >= text.length()) return {0, 0};
        return {
            ((c & 0x07) << 18) |
            ((static_cast<unsigned char>(text[index + 1]) & 0x3F) << 12) |
            ((static_cast<unsigned char>(text[index + 2]) & 0x3F) << 6) |
            (static_cast<unsigned char>(text[index + 3]) & 0x3F),
            4
        };
    }

    return {0, 0}; // Invalid or unsupported
}

// Helper: UTF-8 to UTF-32
inline std::u32string to_u32(std::string_view utf8) {
    std::u32string utf32;
    utf32.reserve(utf8.size());
    size_t i = 0;
    while (i < utf8.length()) {
        auto [c, len] = get_char_at(utf8, i);
        if (len == 0) { i++; continue; } // Skip invalid
        utf32.push_back(c);
        i += len;
    }
    return utf32;
}

inline void append_utf8(std::string& out, char32_t c) {
    if (c <= 0x7F) {
        out.push_back(static_cast<char>(c));
    } else if (c <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | ((c >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    } else if (c <= 0xFFFF) {
        out.push_back(static_cast<char>(0xE0 | ((c >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    } else if (c <= 0x10FFFF) {
        out.push_back(static_cast<char>(0xF0 | ((c >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((c >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    }
}

// Helper: UTF-32 to UTF-8
inline std::string to_utf8(const std::u32string& utf32) {
    std::string utf8;
    utf8.reserve(utf32.size() * 3); // Thai is 3 bytes per codepoint
    for (char32_t c : utf32) {
        append_utf8(utf8, c);
    }
    return utf8;
}

// Codepoint count without full conversion
inline size_t codepoint_length(std::string_view s) {
    size_t count = 0;
    size_t i = 0;
    while (i < s.length()) {
        auto [cp, len] = get_char_at(s, i);
        if (len == 0) { i++; continue; }
        count++;
        i += len;
    }
    return count;
}

} // namespace thai

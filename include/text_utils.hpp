//
//  text_utils.hpp
//  VttForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>

namespace vttforge {

inline constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

inline bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

inline bool is_digit(char c) { return c >= '0' && c <= '9'; }

inline bool is_ascii_alpha(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }

inline std::string_view trim_view(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && is_space(s[b])) {
        ++b;
    }
    while (e > b && is_space(s[e - 1])) {
        --e;
    }
    return s.substr(b, e - b);
}

inline std::string trim(std::string_view s) { return std::string(trim_view(s)); }

inline std::string rtrim(std::string_view s) {
    size_t e = s.size();
    while (e > 0 && is_space(s[e - 1])) {
        --e;
    }
    return std::string(s.substr(0, e));
}

// A line counts as blank when it holds nothing but whitespace.
inline bool is_blank(std::string_view s) { return trim_view(s).empty(); }

inline std::string_view strip_bom(std::string_view s) {
    if (s.substr(0, kUtf8Bom.size()) == kUtf8Bom) {
        s.remove_prefix(kUtf8Bom.size());
    }
    return s;
}

inline std::string to_lower_ascii(std::string_view s) {
    std::string out(s);
    for (auto &c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

inline bool starts_with_ci(std::string_view s, std::string_view prefix) {
    if (s.size() < prefix.size()) {
        return false;
    }
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(s[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

// Number of Unicode code points in a UTF-8 string (continuation bytes are not counted).
inline size_t utf8_length(std::string_view s) {
    size_t n = 0;
    for (char c : s) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++n;
        }
    }
    return n;
}

// Byte length of the whitespace code point starting at s[i], or 0 when there is none.
// Covers ASCII whitespace, NEL, NBSP and the Unicode space separators (U+1680,
// U+2000..U+200A, U+2028, U+2029, U+202F, U+205F, U+3000).
inline size_t utf8_space_length(std::string_view s, size_t i) {
    if (i >= s.size()) {
        return 0;
    }
    if (is_space(s[i])) {
        return 1;
    }
    const auto byte = [&](size_t k) {
        return k < s.size() ? static_cast<unsigned char>(s[k]) : 0u;
    };
    const unsigned b0 = byte(i);
    const unsigned b1 = byte(i + 1);
    const unsigned b2 = byte(i + 2);
    if (b0 == 0xC2 && (b1 == 0x85 || b1 == 0xA0)) {
        return 2;
    }
    if (b0 == 0xE1 && b1 == 0x9A && b2 == 0x80) {
        return 3;
    }
    if (b0 == 0xE2 && b1 == 0x80 &&
        ((b2 >= 0x80 && b2 <= 0x8A) || b2 == 0xA8 || b2 == 0xA9 || b2 == 0xAF)) {
        return 3;
    }
    if ((b0 == 0xE2 && b1 == 0x81 && b2 == 0x9F) || (b0 == 0xE3 && b1 == 0x80 && b2 == 0x80)) {
        return 3;
    }
    return 0;
}

// Last code point of a UTF-8 string as its byte sequence (empty for an empty string).
inline std::string_view utf8_last_char(std::string_view s) {
    if (s.empty()) {
        return s;
    }
    size_t pos = s.size() - 1;
    while (pos > 0 && (static_cast<unsigned char>(s[pos]) & 0xC0) == 0x80) {
        --pos;
    }
    return s.substr(pos);
}

}  // namespace vttforge

//
//  text_utils.hpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

// Text helpers shared by the chunker and the renderers.

inline bool is_ascii_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

inline std::string trim_copy(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && is_ascii_space(s[b])) {
        ++b;
    }
    while (e > b && is_ascii_space(s[e - 1])) {
        --e;
    }
    return std::string(s.substr(b, e - b));
}

// Collapse runs of whitespace (newlines included) into one space, trimming both ends.
inline std::string normalize_whitespace(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    bool pending_space = false;
    for (char c : s) {
        if (is_ascii_space(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(c);
    }
    return out;
}

inline std::vector<std::string> split_whitespace(std::string_view s) {
    std::vector<std::string> tokens;
    size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && is_ascii_space(s[i])) {
            ++i;
        }
        size_t start = i;
        while (i < s.size() && !is_ascii_space(s[i])) {
            ++i;
        }
        if (i > start) {
            tokens.emplace_back(s.substr(start, i - start));
        }
    }
    return tokens;
}

// Number of code points in a UTF-8 string (continuation bytes are not counted).
inline size_t utf8_length(std::string_view s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) {
            ++n;
        }
    }
    return n;
}

inline bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

inline std::string to_lower_ascii(std::string_view s) {
    std::string out(s);
    for (auto &c : out) {
        c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

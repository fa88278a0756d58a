//
//  speaker_colors.cpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "speaker_colors.hpp"

#include <cctype>
#include <utility>

#include "text_utils.hpp"

namespace subforge {

namespace {

// Named colors in BGR order, as ASS expects them.
constexpr std::pair<std::string_view, std::string_view> kBgrTable[] = {
    {"white", "FFFFFF"},   {"yellow", "00FFFF"},     {"cyan", "FFFF00"},  {"lime", "00FF00"},
    {"magenta", "FF00FF"}, {"red", "0000FF"},        {"aqua", "FFFF00"},  {"chartreuse", "00FF7F"},
    {"coral", "507FFF"},   {"gold", "00D7FF"},       {"pink", "CBC0FF"},  {"lavender", "FAE6E6"},
    {"orange", "00A5FF"},  {"orchid", "D670DA"},     {"plum", "DDA0DD"},  {"salmon", "7280FA"},
};

constexpr std::string_view kFallbackBgr = "FFFFFF";

bool is_hex_code(std::string_view s) {
    if (s.size() != 6) {
        return false;
    }
    for (char c : s) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

}  // namespace

std::string color_for(const std::string &speaker_id, const SpeakerColorMap *explicit_map) {
    if (explicit_map) {
        auto it = explicit_map->find(speaker_id);
        if (it != explicit_map->end()) {
            return it->second;
        }
    }
    const uint64_t slot = fnv1a_64(speaker_id) % kSpeakerPalette.size();
    return kSpeakerPalette[slot];
}

std::string ass_bgr_for_color(std::string_view color) {
    if (is_hex_code(color)) {
        std::string out(color);
        for (auto &c : out) {
            c = static_cast<char>(::toupper(static_cast<unsigned char>(c)));
        }
        return out;
    }
    const std::string name = to_lower_ascii(color);
    for (const auto &entry : kBgrTable) {
        if (entry.first == name) {
            return std::string(entry.second);
        }
    }
    return std::string(kFallbackBgr);
}

}  // namespace subforge

//
//  speaker_colors.hpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace subforge {

using SpeakerColorMap = std::map<std::string, std::string>;

// Easy-to-distinguish colors, in hash slot order.
inline constexpr std::array<const char *, 15> kSpeakerPalette = {
    "yellow", "cyan",  "lime",     "magenta", "red",    "aqua",   "chartreuse", "coral",
    "gold",   "pink",  "lavender", "orange",  "orchid", "plum",   "salmon"};

/**
 * @brief FNV-1a 64-bit hash of the UTF-8 bytes of @p s.
 *
 * Stable across processes and platforms; used to pick palette slots.
 */
inline constexpr uint64_t fnv1a_64(std::string_view s) {
    uint64_t hash = 14695981039346656037ULL;
    for (char c : s) {
        hash ^= static_cast<uint8_t>(c);
        hash *= 1099511628211ULL;
    }
    return hash;
}

/**
 * @brief Display color for a speaker.
 *
 * An entry in @p explicit_map wins unchanged. Otherwise the speaker id is hashed
 * into kSpeakerPalette, so the same id always gets the same color.
 */
std::string color_for(const std::string &speaker_id,
                      const SpeakerColorMap *explicit_map = nullptr);

/**
 * @brief ASS color code (BBGGRR hex, no prefix) for a named color.
 *
 * A six-digit hex value passes through upper-cased; unknown names map to white.
 */
std::string ass_bgr_for_color(std::string_view color);

}  // namespace subforge

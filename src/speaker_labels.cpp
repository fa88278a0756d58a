//
//  speaker_labels.cpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "speaker_labels.hpp"

#include <cctype>

#include "text_utils.hpp"

namespace subforge {

namespace {
constexpr std::string_view kDiarizerPrefix = "SPEAKER_";
}  // namespace

std::string normalize_speaker_label(const std::string &speaker_id) {
    if (!starts_with(speaker_id, kDiarizerPrefix) || speaker_id.size() == kDiarizerPrefix.size()) {
        return speaker_id;
    }
    std::string digits = speaker_id.substr(kDiarizerPrefix.size());
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return speaker_id;
        }
    }
    const size_t first = digits.find_first_not_of('0');
    digits = (first == std::string::npos) ? "0" : digits.substr(first);
    return "Speaker " + digits;
}

std::map<std::string, std::string> derive_display_names(const std::vector<std::string> &ordered_ids,
                                                        SpeakerLabelMode mode) {
    std::map<std::string, std::string> names;
    size_t next = 1;
    for (const auto &id : ordered_ids) {
        if (names.count(id)) {
            continue;
        }
        if (mode == SpeakerLabelMode::Numeric) {
            names[id] = "Speaker " + std::to_string(next++);
        } else {
            names[id] = normalize_speaker_label(id);
        }
    }
    return names;
}

}  // namespace subforge

//
//  speaker_labels.hpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <map>
#include <string>
#include <vector>

namespace subforge {

enum class SpeakerLabelMode {
    Normalized,  ///< SPEAKER_01 -> "Speaker 1"; other ids are shown as-is
    Numeric,     ///< "Speaker 1", "Speaker 2", ... in first-seen order
};

// "SPEAKER_007" -> "Speaker 7", "SPEAKER_00" -> "Speaker 0"; anything else unchanged.
std::string normalize_speaker_label(const std::string &speaker_id);

// Display names for @p ordered_ids (distinct ids in first-seen order).
std::map<std::string, std::string> derive_display_names(const std::vector<std::string> &ordered_ids,
                                                        SpeakerLabelMode mode);

}  // namespace subforge

//
//  subtitle_track.cpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "subtitle_track.hpp"

#include <utility>

#include "subtitle_errors.hpp"
#include "subtitle_renderers.hpp"
#include "text_utils.hpp"

namespace subforge {

TrackFormat parse_track_format(std::string_view name) {
    const std::string lower = to_lower_ascii(trim_copy(name));
    if (lower == "srt") {
        return TrackFormat::Srt;
    }
    if (lower == "vtt" || lower == "webvtt") {
        return TrackFormat::Vtt;
    }
    if (lower == "ass" || lower == "ssa") {
        return TrackFormat::Ass;
    }
    throw UnsupportedFormat("unsupported subtitle format '" + std::string(name) +
                            "' (expected srt, vtt or ass)");
}

const char *track_format_name(TrackFormat format) {
    return renderer_for(format).name;
}

const EntryBase &entry_base(const Entry &entry) {
    return std::visit([](const auto &e) -> const EntryBase & { return e; }, entry);
}

TrackFormat entry_format(const Entry &entry) {
    // Variant alternatives are declared in TrackFormat order.
    return static_cast<TrackFormat>(entry.index());
}

SubtitleTrack::SubtitleTrack(TrackMetadata metadata, std::vector<Entry> entries)
    : metadata_(std::move(metadata)), entries_(std::move(entries)) {}

std::string SubtitleTrack::content() const {
    return renderer_for(metadata_.format).render(metadata_, entries_);
}

}  // namespace subforge

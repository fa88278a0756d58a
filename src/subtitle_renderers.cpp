//
//  subtitle_renderers.cpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "subtitle_renderers.hpp"

#include <array>
#include <sstream>

#include "subtitle_errors.hpp"

namespace subforge {

namespace {

// Indexed by TrackFormat.
const std::array<FormatRenderer, kTrackFormatCount> kRenderers = {{
    {TrackFormat::Srt, "srt", ".srt", "application/x-subrip", &make_srt_entry, &render_srt},
    {TrackFormat::Vtt, "vtt", ".vtt", "text/vtt", &make_vtt_entry, &render_vtt},
    {TrackFormat::Ass, "ass", ".ass", "text/x-ssa", &make_ass_entry, &render_ass},
}};

}  // namespace

const FormatRenderer &renderer_for(TrackFormat format) {
    const auto slot = static_cast<size_t>(format);
    if (slot >= kRenderers.size()) {
        throw UnsupportedFormat("unsupported subtitle format id " + std::to_string(slot));
    }
    return kRenderers[slot];
}

EntryBase make_entry_base(const Chunk &chunk, int index, size_t word_count) {
    EntryBase base;
    base.index = index;
    base.start = chunk.start;
    base.end = chunk.end;
    base.text = chunk.text;
    base.speaker_id = chunk.speaker;
    base.word_count = word_count;
    return base;
}

void throw_format_mismatch(TrackFormat expected, const Entry &entry, size_t position) {
    std::ostringstream oss;
    oss << renderer_for(expected).name << " renderer received a "
        << renderer_for(entry_format(entry)).name << " entry at position " << position;
    throw FormatMismatch(oss.str());
}

}  // namespace subforge

//
//  srt_renderer.cpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include <sstream>

#include "logging.hpp"
#include "subtitle_renderers.hpp"
#include "subtitle_timing.hpp"

namespace subforge {

Entry make_srt_entry(const Chunk &chunk, int index, size_t word_count,
                     const EntryContext & /*context*/) {
    SrtEntry e;
    static_cast<EntryBase &>(e) = make_entry_base(chunk, index, word_count);
    return e;
}

std::string render_srt(const TrackMetadata & /*metadata*/, const std::vector<Entry> &entries) {
    std::ostringstream out;
    for (size_t i = 0; i < entries.size(); ++i) {
        const auto *e = std::get_if<SrtEntry>(&entries[i]);
        if (!e) {
            throw_format_mismatch(TrackFormat::Srt, entries[i], i);
        }
        out << e->index << "\n"
            << format_srt_time(e->start) << " --> " << format_srt_time(e->end) << "\n"
            << e->text << "\n\n";
    }
    SF_LOG("render", "srt: " << entries.size() << " cues");
    return out.str();
}

}  // namespace subforge

//
//  vtt_renderer.cpp
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

std::string escape_vtt_text(const std::string &text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&':
                out += "&amp;";
                break;
            case '<':
                out += "&lt;";
                break;
            case '>':
                out += "&gt;";
                break;
            default:
                out.push_back(c);
        }
    }
    return out;
}

Entry make_vtt_entry(const Chunk &chunk, int index, size_t word_count,
                     const EntryContext &context) {
    VttEntry e;
    static_cast<EntryBase &>(e) = make_entry_base(chunk, index, word_count);
    // A prefixed cue already names its speaker; a voice span would repeat it.
    if (chunk.speaker && !context.include_speaker_prefix) {
        auto it = context.metadata.speakers.find(*chunk.speaker);
        if (it != context.metadata.speakers.end() && it->second.display_name) {
            e.voice = *it->second.display_name;
        } else {
            e.voice = *chunk.speaker;
        }
    }
    return e;
}

std::string render_vtt(const TrackMetadata & /*metadata*/, const std::vector<Entry> &entries) {
    std::ostringstream out;
    out << "WEBVTT\n\n";
    for (size_t i = 0; i < entries.size(); ++i) {
        const auto *e = std::get_if<VttEntry>(&entries[i]);
        if (!e) {
            throw_format_mismatch(TrackFormat::Vtt, entries[i], i);
        }
        out << e->index << "\n"
            << format_vtt_time(e->start) << " --> " << format_vtt_time(e->end) << "\n";
        if (e->voice) {
            out << "<v " << escape_vtt_text(*e->voice) << ">" << escape_vtt_text(e->text)
                << "</v>";
        } else {
            out << escape_vtt_text(e->text);
        }
        out << "\n\n";
    }
    SF_LOG("render", "vtt: " << entries.size() << " cues");
    return out.str();
}

}  // namespace subforge

//
//  track_assembler.cpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "track_assembler.hpp"

#include <algorithm>
#include <utility>
#include <vector>

#include "chunker.hpp"
#include "logging.hpp"
#include "subtitle_renderers.hpp"
#include "text_utils.hpp"

namespace subforge {

namespace {

size_t chunk_word_count(const Chunk &chunk) {
    if (!chunk.words.empty()) {
        return chunk.words.size();
    }
    return split_whitespace(chunk.text).size();
}

std::vector<std::string> speakers_in_order(const std::vector<Chunk> &chunks) {
    std::vector<std::string> ids;
    for (const auto &c : chunks) {
        if (c.speaker && std::find(ids.begin(), ids.end(), *c.speaker) == ids.end()) {
            ids.push_back(*c.speaker);
        }
    }
    return ids;
}

}  // namespace

SubtitleTrack assemble_track(const Transcript &transcript, TrackFormat format,
                             const AssembleOptions &options) {
    const FormatRenderer &renderer = renderer_for(format);
    validate_transcript(transcript);

    std::vector<Chunk> chunks = chunk_transcript(transcript, options.chunking);

    TrackMetadata meta;
    meta.format = format;
    meta.language = transcript.language;
    meta.title = options.title;
    meta.style = options.style;

    const std::vector<std::string> speaker_ids = speakers_in_order(chunks);
    const auto display_names = derive_display_names(speaker_ids, options.speaker_labels);
    for (const auto &id : speaker_ids) {
        SpeakerInfo info;
        info.id = id;
        info.color = color_for(id, &options.speaker_colors);
        info.display_name = display_names.at(id);
        meta.speakers.emplace(id, std::move(info));
    }

    // Counted before prefixing so labels do not inflate the figures.
    std::vector<size_t> word_counts;
    word_counts.reserve(chunks.size());
    for (const auto &c : chunks) {
        word_counts.push_back(chunk_word_count(c));
        meta.word_count += word_counts.back();
        meta.duration = std::max(meta.duration, c.end);
    }

    if (options.include_speaker_prefix) {
        for (auto &c : chunks) {
            if (c.speaker) {
                c.text = "[" + display_names.at(*c.speaker) + "] " + c.text;
            }
        }
    }

    const EntryContext context{meta, options.include_speaker_prefix};
    std::vector<Entry> entries;
    entries.reserve(chunks.size());
    for (size_t i = 0; i < chunks.size(); ++i) {
        entries.push_back(
            renderer.make_entry(chunks[i], static_cast<int>(i + 1), word_counts[i], context));
    }

    SF_LOG("debug", "assembled " << renderer.name << " track: " << entries.size() << " cues, "
                                << meta.speakers.size() << " speakers, " << meta.word_count
                                << " words, " << meta.duration << "s");
    return SubtitleTrack(std::move(meta), std::move(entries));
}

}  // namespace subforge

//
//  subtitle_renderers.hpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <map>
#include <string>
#include <vector>

#include "chunk.hpp"
#include "subtitle_track.hpp"

namespace subforge {

/// Per-track inputs to entry construction.
struct EntryContext {
    const TrackMetadata &metadata;
    bool include_speaker_prefix = false;
};

using MakeEntryFn = Entry (*)(const Chunk &chunk, int index, size_t word_count,
                              const EntryContext &context);
using RenderFn = std::string (*)(const TrackMetadata &metadata, const std::vector<Entry> &entries);

/**
 * @brief Everything format specific, one row per TrackFormat.
 *
 * Rows are read-only; callers resolve a format once and then only go through the row.
 */
struct FormatRenderer {
    TrackFormat format;
    const char *name;
    const char *file_extension;
    const char *content_type;
    MakeEntryFn make_entry;
    RenderFn render;
};

const FormatRenderer &renderer_for(TrackFormat format);

// Common cue fields taken from a chunk.
EntryBase make_entry_base(const Chunk &chunk, int index, size_t word_count);

// Entry construction rules.
Entry make_srt_entry(const Chunk &chunk, int index, size_t word_count, const EntryContext &context);
Entry make_vtt_entry(const Chunk &chunk, int index, size_t word_count, const EntryContext &context);
Entry make_ass_entry(const Chunk &chunk, int index, size_t word_count, const EntryContext &context);

// Document renderers. Each throws FormatMismatch when handed another format's entries.
std::string render_srt(const TrackMetadata &metadata, const std::vector<Entry> &entries);
std::string render_vtt(const TrackMetadata &metadata, const std::vector<Entry> &entries);
std::string render_ass(const TrackMetadata &metadata, const std::vector<Entry> &entries);

// Escape cue text for WebVTT (& < >).
std::string escape_vtt_text(const std::string &text);

// Escape dialogue text for ASS: newlines become \N, braces are escaped.
std::string escape_ass_text(const std::string &text);

// Style name used for a speaker's ASS style ("SPEAKER_01" -> "Speaker_01").
std::string ass_style_name(const std::string &speaker_id);

// Distinct style names for @p speaker_ids, assigned in the given order. A name
// already taken gets the first free numeric suffix ("Speaker_01_2").
std::map<std::string, std::string> ass_style_names(const std::vector<std::string> &speaker_ids);

// Throws FormatMismatch naming the renderer and the offending entry.
[[noreturn]] void throw_format_mismatch(TrackFormat expected, const Entry &entry, size_t position);

}  // namespace subforge

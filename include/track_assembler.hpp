//
//  track_assembler.hpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <optional>
#include <string>

#include "chunk.hpp"
#include "speaker_colors.hpp"
#include "speaker_labels.hpp"
#include "subtitle_track.hpp"
#include "transcript.hpp"

namespace subforge {

/// @ingroup api
/// Knobs for turning a transcript into a track.
struct AssembleOptions {
    ChunkOptions chunking;
    bool include_speaker_prefix = false;  ///< Prepend "[Speaker N] " to cue text
    SpeakerLabelMode speaker_labels = SpeakerLabelMode::Normalized;
    SpeakerColorMap speaker_colors;       ///< Explicit colors; others are hashed
    std::optional<std::string> title;
    std::optional<AssStyle> style;
};

/**
 * @brief Build a subtitle track from a transcript.
 *
 * Validates the transcript (SchemaValidationError), chunks it, registers every
 * speaker with a color and display name and builds the format's entries.
 * Pure: no I/O, no state kept between calls.
 */
SubtitleTrack assemble_track(const Transcript &transcript, TrackFormat format,
                             const AssembleOptions &options = AssembleOptions{});

}  // namespace subforge

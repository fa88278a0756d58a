//
//  subforge.hpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>

#include "subtitle_track.hpp"
#include "track_assembler.hpp"
#include "transcript.hpp"

namespace subforge {

/// @defgroup api SubForge Public API
/// Public, supported C++ interfaces for compiling transcripts into subtitles.
/// @{

/**
 * @brief Result object with success flag and optional error message.
 *
 * When `ok == true`, `message` is empty. On failure, `message` contains a short description of
 * what went wrong (e.g., schema errors in the transcript or an unknown format name).
 */
struct RenderStatus {
    bool ok{false};
    std::string message;
};

/// Rendered document plus status.
struct RenderResult {
    RenderStatus status;
    std::string content;  ///< Empty unless status.ok
};

/**
 * @brief Return the SubForge library version string.
 *
 * Follows the same formatting as the CLI banner (e.g. `v0.3`).
 */
std::string version_string();  ///< @ingroup api

/**
 * @brief Compile a transcript into a complete subtitle document.
 *
 * Throws SchemaValidationError for an invalid transcript and std::invalid_argument
 * for invalid chunking limits.
 */
std::string render_transcript(const Transcript &transcript, TrackFormat format,
                              const AssembleOptions &options = AssembleOptions{});  ///< @ingroup api

/// Parse a transcript JSON document and render it; errors are reported in the status.
RenderResult render_transcript_json(const std::string &json_text, const std::string &format_name,
                                    const AssembleOptions &options = AssembleOptions{});  ///< @ingroup api

/// @overload reading the transcript JSON from a file.
RenderResult render_transcript_file(const std::string &transcript_path,
                                    const std::string &format_name,
                                    const AssembleOptions &options = AssembleOptions{});  ///< @ingroup api

/// @}

}  // namespace subforge

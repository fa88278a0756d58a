//
//  render_options.hpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <optional>
#include <string>

#include "subforge.hpp"
#include "track_assembler.hpp"

namespace subforge {

/// Everything a render run can be configured with.
struct RenderOptions {
    std::optional<TrackFormat> format;  ///< Unset: derive from the output file extension
    AssembleOptions assemble;
};

/**
 * @brief Overlay a JSON config document onto @p options.
 *
 * Only keys present in the document change @p options. Recognized keys:
 * `format`, `max_duration`, `max_length`, `max_words`, `min_duration`,
 * `include_speaker_prefix`, `speaker_labels` ("normalized" | "numeric"),
 * `speaker_colors` (object), `title`, `style` (object of AssStyle fields).
 */
RenderStatus apply_render_options_json(const std::string &json_text, RenderOptions &options);

/// @overload reading the config from a file.
RenderStatus load_render_options_file(const std::string &path, RenderOptions &options);

/// Format implied by a file name's extension (".srt", ".vtt", ".ass"/".ssa").
std::optional<TrackFormat> format_from_extension(const std::string &path);

}  // namespace subforge

//
//  chunker.hpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <vector>

#include "chunk.hpp"
#include "transcript.hpp"

namespace subforge {

// Minimum segment duration; shorter segments are skipped.
inline constexpr double kDegenerateSegmentSeconds = 0.1;

/**
 * @brief Convert a transcript into ordered subtitle-sized chunks.
 *
 * Segments with word timing are re-grouped word by word, splitting on speaker
 * changes and on the word/duration/length limits. Segments without word timing
 * are split at punctuation (then at word boundaries) when they exceed the
 * duration or length limits, with times allocated by text length.
 *
 * The result is ordered by non-decreasing start and never holds an empty chunk.
 * Throws std::invalid_argument for non-positive limits.
 */
std::vector<Chunk> chunk_transcript(const Transcript &transcript,
                                    const ChunkOptions &options = ChunkOptions{});

/// Split @p text after each of `. ! ? , : ;` and re-join pieces up to @p limit
/// code points. Pieces are trimmed; empty pieces are dropped.
std::vector<std::string> split_at_punctuation(const std::string &text, size_t limit);

/// Split @p text at whitespace into fragments of at most @p max_length code
/// points and @p max_words words. A single word longer than @p max_length
/// forms its own fragment.
std::vector<std::string> split_by_words(const std::string &text, size_t max_length,
                                        size_t max_words);

}  // namespace subforge

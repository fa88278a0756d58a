//
//  chunk.hpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace subforge {

/// A timed word carried into a chunk.
struct ChunkWord {
    std::string word;
    double start = 0.0;
    double end = 0.0;
    std::optional<std::string> speaker;
};

/// Format-agnostic timed text unit, produced by the chunker before rendering.
struct Chunk {
    double start = 0.0;
    double end = 0.0;
    std::string text;
    std::optional<std::string> speaker;
    std::vector<ChunkWord> words;  ///< Empty when the source segment had no word timing
};

/// Limits applied while chunking.
struct ChunkOptions {
    double max_duration = 5.0;  ///< Seconds per chunk
    size_t max_length = 80;     ///< Code points per chunk
    size_t max_words = 14;      ///< Words per chunk
    double min_duration = 1.0;  ///< Lower bound for fragments of split segments
};

}  // namespace subforge

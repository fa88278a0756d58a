//
//  transcript.hpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace subforge {

/// @ingroup api
/// A single timed word from a word-aligned transcript.
struct Word {
    std::string word;                    ///< Token text as produced by the recognizer
    double start = 0.0;                  ///< Seconds
    double end = 0.0;                    ///< Seconds, >= start
    std::optional<std::string> speaker;  ///< Overrides the segment speaker when set
    std::optional<double> probability;   ///< Recognizer confidence
};

/// @ingroup api
/// One speech segment of a diarized transcript.
struct Segment {
    std::optional<int> id;
    double start = 0.0;
    double end = 0.0;
    std::string text;
    std::optional<std::string> speaker;
    std::optional<std::vector<Word>> words;  ///< Present when word-level timing is available
};

/// @ingroup api
/// Ordered transcript as supplied by the transcription stage.
struct Transcript {
    std::string language = "en";
    std::vector<Segment> segments;
};

/// Summary figures over a transcript (segments and words per speaker).
struct TranscriptStats {
    std::string language;
    size_t segment_count = 0;
    size_t total_words = 0;
    std::map<std::string, size_t> speaker_segments;
    std::map<std::string, size_t> speaker_words;
};

// Label used for segments that carry no speaker attribution.
inline constexpr const char *kUnknownSpeaker = "Unknown";

/// Throws SchemaValidationError naming the first offending field
/// (e.g. `segments[2].words[0].end`).
void validate_transcript(const Transcript &transcript);

// Speaker attribution with blank ids ("" or whitespace only) treated as absent.
std::optional<std::string> attributed_speaker(const std::optional<std::string> &speaker);

/// Word count of a segment: timed words when present, else whitespace tokens.
size_t segment_word_count(const Segment &segment);

TranscriptStats compute_transcript_stats(const Transcript &transcript);

}  // namespace subforge

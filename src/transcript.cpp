//
//  transcript.cpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "transcript.hpp"

#include <cmath>
#include <sstream>

#include "logging.hpp"
#include "subtitle_errors.hpp"
#include "text_utils.hpp"

namespace subforge {

namespace {

void check_timing(double start, double end, const std::string &where) {
    if (!std::isfinite(start)) {
        throw SchemaValidationError(where + ".start: not a finite number");
    }
    if (!std::isfinite(end)) {
        throw SchemaValidationError(where + ".end: not a finite number");
    }
    if (end < start) {
        std::ostringstream oss;
        oss << where << ".end: " << end << " is before start " << start;
        throw SchemaValidationError(oss.str());
    }
}

}  // namespace

void validate_transcript(const Transcript &transcript) {
    for (size_t i = 0; i < transcript.segments.size(); ++i) {
        const auto &seg = transcript.segments[i];
        const std::string where = "segments[" + std::to_string(i) + "]";
        check_timing(seg.start, seg.end, where);
        if (!seg.words) {
            continue;
        }
        for (size_t w = 0; w < seg.words->size(); ++w) {
            const auto &word = (*seg.words)[w];
            check_timing(word.start, word.end, where + ".words[" + std::to_string(w) + "]");
        }
    }
    SF_LOG("debug", "transcript ok: language=" << transcript.language
                                               << " segments=" << transcript.segments.size());
}

size_t segment_word_count(const Segment &segment) {
    if (segment.words && !segment.words->empty()) {
        size_t count = 0;
        for (const auto &w : *segment.words) {
            if (!trim_copy(w.word).empty()) {
                ++count;
            }
        }
        return count;
    }
    return split_whitespace(segment.text).size();
}

std::optional<std::string> attributed_speaker(const std::optional<std::string> &speaker) {
    if (!speaker || trim_copy(*speaker).empty()) {
        return std::nullopt;
    }
    return speaker;
}

TranscriptStats compute_transcript_stats(const Transcript &transcript) {
    TranscriptStats stats;
    stats.language = transcript.language;
    stats.segment_count = transcript.segments.size();
    for (const auto &seg : transcript.segments) {
        const std::string speaker = attributed_speaker(seg.speaker).value_or(kUnknownSpeaker);
        const size_t words = segment_word_count(seg);
        stats.total_words += words;
        stats.speaker_segments[speaker] += 1;
        stats.speaker_words[speaker] += words;
    }
    return stats;
}

}  // namespace subforge

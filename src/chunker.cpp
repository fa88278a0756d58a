//
//  chunker.cpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "chunker.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "logging.hpp"
#include "text_utils.hpp"

namespace subforge {

namespace {

bool is_split_punctuation(char c) {
    return c == '.' || c == '!' || c == '?' || c == ',' || c == ':' || c == ';';
}

void validate_options(const ChunkOptions &options) {
    if (!(options.max_duration > 0.0)) {
        throw std::invalid_argument("max_duration must be positive");
    }
    if (options.max_length == 0) {
        throw std::invalid_argument("max_length must be positive");
    }
    if (options.max_words == 0) {
        throw std::invalid_argument("max_words must be positive");
    }
    if (options.min_duration < 0.0) {
        throw std::invalid_argument("min_duration must not be negative");
    }
}

// Collects chunks in emission order. Word-timed input goes through a pending
// chunk that is flushed whenever the next word would break a limit.
class ChunkAccumulator {
   public:
    explicit ChunkAccumulator(const ChunkOptions &options) : options_(options) {}

    void add_word(std::string token, double start, double end,
                  const std::optional<std::string> &speaker) {
        const size_t token_length = utf8_length(token);
        if (!pending_.empty() && must_flush_before(token_length, end, speaker)) {
            flush();
        }
        if (pending_.empty()) {
            pending_speaker_ = speaker;
            pending_length_ = token_length;
            pending_text_ = token;
        } else {
            pending_length_ += 1 + token_length;
            pending_text_ += ' ';
            pending_text_ += token;
        }
        pending_.push_back(ChunkWord{std::move(token), start, end, speaker});
    }

    void flush() {
        if (pending_.empty()) {
            return;
        }
        Chunk c;
        c.start = pending_.front().start;
        c.end = std::max(pending_.back().end, c.start);
        c.text = std::move(pending_text_);
        c.speaker = std::move(pending_speaker_);
        c.words = std::move(pending_);
        chunks_.push_back(std::move(c));
        pending_.clear();
        pending_text_.clear();
        pending_speaker_.reset();
        pending_length_ = 0;
    }

    void add_untimed_segment(const Segment &seg, const std::string &text,
                             const std::optional<std::string> &speaker) {
        const double duration = seg.end - seg.start;
        const size_t length = utf8_length(text);
        if (duration <= options_.max_duration && length <= options_.max_length) {
            push_text_chunk(seg.start, seg.end, text, speaker);
            return;
        }

        size_t limit = options_.max_length;
        if (duration > options_.max_duration) {
            // Characters the duration limit allows at this segment's speaking rate.
            const double budget =
                static_cast<double>(length) * options_.max_duration / duration;
            limit = std::min(limit, std::max<size_t>(1, static_cast<size_t>(budget)));
        }

        std::vector<std::string> fragments;
        for (auto &piece : split_at_punctuation(text, limit)) {
            if (utf8_length(piece) > options_.max_length) {
                for (auto &part : split_by_words(piece, options_.max_length, options_.max_words)) {
                    fragments.push_back(std::move(part));
                }
            } else {
                fragments.push_back(std::move(piece));
            }
        }

        size_t total_chars = 0;
        for (const auto &f : fragments) {
            total_chars += utf8_length(f);
        }
        if (total_chars == 0) {
            return;
        }
        SF_LOG("chunker", "split segment [" << seg.start << ", " << seg.end << "] into "
                                            << fragments.size() << " fragments");

        // Fragments tile the segment by their share of the text; only the end is
        // stretched to honor min_duration.
        size_t chars_before = 0;
        for (auto &f : fragments) {
            const size_t chars = utf8_length(f);
            const double f_start =
                seg.start + duration * static_cast<double>(chars_before) / total_chars;
            double f_end =
                seg.start + duration * static_cast<double>(chars_before + chars) / total_chars;
            if (f_end - f_start < options_.min_duration) {
                f_end = f_start + options_.min_duration;
            }
            chars_before += chars;
            push_text_chunk(f_start, f_end, std::move(f), speaker);
        }
    }

    std::vector<Chunk> take() { return std::move(chunks_); }

   private:
    bool must_flush_before(size_t token_length, double word_end,
                           const std::optional<std::string> &speaker) const {
        if (speaker != pending_speaker_) {
            return true;
        }
        if (pending_.size() >= options_.max_words) {
            return true;
        }
        if (word_end - pending_.front().start > options_.max_duration) {
            return true;
        }
        return pending_length_ + 1 + token_length > options_.max_length;
    }

    void push_text_chunk(double start, double end, std::string text,
                         const std::optional<std::string> &speaker) {
        if (text.empty()) {
            return;
        }
        Chunk c;
        c.start = start;
        c.end = end;
        c.text = std::move(text);
        c.speaker = speaker;
        chunks_.push_back(std::move(c));
    }

    const ChunkOptions &options_;
    std::vector<Chunk> chunks_;
    std::vector<ChunkWord> pending_;
    std::string pending_text_;
    size_t pending_length_ = 0;
    std::optional<std::string> pending_speaker_;
};

}  // namespace

std::vector<std::string> split_at_punctuation(const std::string &text, size_t limit) {
    // Break after punctuation that ends a token, so "3.5" or "U.S." stay whole.
    std::vector<std::string> pieces;
    std::string current;
    for (size_t i = 0; i < text.size(); ++i) {
        current.push_back(text[i]);
        const bool at_boundary = i + 1 == text.size() || is_ascii_space(text[i + 1]);
        if (is_split_punctuation(text[i]) && at_boundary) {
            pieces.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        pieces.push_back(std::move(current));
    }

    std::vector<std::string> out;
    std::string joined;
    for (auto &piece : pieces) {
        std::string candidate = joined + piece;
        if (!trim_copy(joined).empty() && utf8_length(trim_copy(candidate)) > limit) {
            out.push_back(trim_copy(joined));
            joined = std::move(piece);
        } else {
            joined = std::move(candidate);
        }
    }
    std::string tail = trim_copy(joined);
    if (!tail.empty()) {
        out.push_back(std::move(tail));
    }
    return out;
}

std::vector<std::string> split_by_words(const std::string &text, size_t max_length,
                                        size_t max_words) {
    std::vector<std::string> out;
    std::string current;
    size_t current_length = 0;
    size_t count = 0;
    for (const auto &w : split_whitespace(text)) {
        const size_t wl = utf8_length(w);
        if (count > 0 && (count >= max_words || current_length + 1 + wl > max_length)) {
            out.push_back(std::move(current));
            current.clear();
            current_length = 0;
            count = 0;
        }
        if (count > 0) {
            current += ' ';
            current_length += 1;
        }
        current += w;
        current_length += wl;
        ++count;
    }
    if (count > 0) {
        out.push_back(std::move(current));
    }
    return out;
}

std::vector<Chunk> chunk_transcript(const Transcript &transcript, const ChunkOptions &options) {
    validate_options(options);
    ChunkAccumulator acc(options);
    size_t skipped = 0;

    for (size_t i = 0; i < transcript.segments.size(); ++i) {
        const auto &seg = transcript.segments[i];
        if (seg.end - seg.start < kDegenerateSegmentSeconds) {
            ++skipped;
            continue;
        }
        const auto seg_speaker = attributed_speaker(seg.speaker);
        bool timed = false;
        if (seg.words) {
            for (const auto &w : *seg.words) {
                std::string token = trim_copy(w.word);
                if (token.empty()) {
                    continue;
                }
                timed = true;
                const auto word_speaker = attributed_speaker(w.speaker);
                acc.add_word(std::move(token), w.start, w.end,
                             word_speaker ? word_speaker : seg_speaker);
            }
        }
        if (!timed) {
            // Keep emission order: whatever was pending precedes this segment.
            acc.flush();
            acc.add_untimed_segment(seg, normalize_whitespace(seg.text), seg_speaker);
        }
    }
    acc.flush();

    std::vector<Chunk> chunks = acc.take();
    std::stable_sort(chunks.begin(), chunks.end(),
                     [](const Chunk &a, const Chunk &b) { return a.start < b.start; });
    SF_LOG("chunker", "chunked " << transcript.segments.size() << " segments into "
                                 << chunks.size() << " chunks (skipped " << skipped
                                 << " degenerate)");
    return chunks;
}

}  // namespace subforge

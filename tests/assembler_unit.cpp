// Track assembly: speaker registry, labels, prefixes, totals and per-format entries.
#include <cstdio>
#include <string>
#include <vector>

#include "speaker_colors.hpp"
#include "subtitle_errors.hpp"
#include "track_assembler.hpp"
#include "transcript_test_utils.hpp"

using namespace subforge;
using transcript_test_utils::count_occurrences;
using transcript_test_utils::near;
using transcript_test_utils::text_segment;
using transcript_test_utils::timed_segment;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        fprintf(stderr, "[assembler_unit] FAIL: %s\n", msg.c_str());
    }
    return cond;
}

Transcript two_speaker_transcript() {
    Transcript t;
    t.language = "en";
    t.segments.push_back(timed_segment({"good", "evening", "everyone"}, 0.0, 0.5, "SPEAKER_01"));
    t.segments.push_back(timed_segment({"thank", "you", "chair"}, 2.0, 0.5, "SPEAKER_00"));
    t.segments.push_back(text_segment("Next item please", 4.0, 6.0, "SPEAKER_01"));
    return t;
}

bool test_metadata() {
    AssembleOptions opts;
    opts.speaker_colors["SPEAKER_00"] = "orchid";
    opts.title = "Regular session";
    auto track = assemble_track(two_speaker_transcript(), TrackFormat::Srt, opts);
    const auto &m = track.metadata();
    bool ok = true;
    ok &= check(m.format == TrackFormat::Srt, "format recorded");
    ok &= check(m.language == "en", "language copied");
    ok &= check(m.title && *m.title == "Regular session", "title copied");
    ok &= check(m.word_count == 9, "word count, got " + std::to_string(m.word_count));
    ok &= check(near(m.duration, 6.0), "duration is the last chunk end");
    ok &= check(m.speakers.size() == 2, "one speaker info per distinct id");
    ok &= check(m.speakers.at("SPEAKER_00").color == "orchid", "explicit color honored");
    ok &= check(m.speakers.at("SPEAKER_01").color == color_for("SPEAKER_01"), "hashed color");
    ok &= check(m.speakers.at("SPEAKER_01").display_name == std::optional<std::string>("Speaker 1"),
                "normalized display name");
    ok &= check(m.speakers.at("SPEAKER_00").display_name == std::optional<std::string>("Speaker 0"),
                "leading zeros stripped");
    ok &= check(track.entries().size() == 3, "three cues");
    for (size_t i = 0; i < track.entries().size(); ++i) {
        ok &= check(entry_base(track.entries()[i]).index == static_cast<int>(i + 1),
                    "1-based sequential index");
        ok &= check(entry_format(track.entries()[i]) == TrackFormat::Srt, "srt entries");
    }
    ok &= check(entry_base(track.entries()[2]).word_count == 3, "untimed cue counts tokens");
    return ok;
}

bool test_speaker_prefix() {
    AssembleOptions opts;
    opts.include_speaker_prefix = true;
    auto track = assemble_track(two_speaker_transcript(), TrackFormat::Srt, opts);
    const auto content = track.content();
    bool ok = true;
    ok &= check(entry_base(track.entries()[0]).text == "[Speaker 1] good evening everyone",
                "prefix added, got: " + entry_base(track.entries()[0]).text);
    ok &= check(content.find("[Speaker 0] thank you chair\n") != std::string::npos,
                "prefix rendered");
    ok &= check(track.metadata().word_count == 9, "prefix does not change word count");
    return ok;
}

bool test_numeric_labels() {
    AssembleOptions opts;
    opts.include_speaker_prefix = true;
    opts.speaker_labels = SpeakerLabelMode::Numeric;
    auto track = assemble_track(two_speaker_transcript(), TrackFormat::Srt, opts);
    bool ok = true;
    ok &= check(entry_base(track.entries()[0]).text == "[Speaker 1] good evening everyone",
                "first speaker numbered 1");
    ok &= check(entry_base(track.entries()[1]).text == "[Speaker 2] thank you chair",
                "second speaker numbered 2");
    ok &= check(track.metadata().speakers.at("SPEAKER_00").display_name ==
                    std::optional<std::string>("Speaker 2"),
                "registry uses numeric name");
    return ok;
}

bool test_vtt_voices() {
    auto track = assemble_track(two_speaker_transcript(), TrackFormat::Vtt);
    const std::string content = track.content();
    bool ok = true;
    ok &= check(content.rfind("WEBVTT\n\n", 0) == 0, "vtt header");
    ok &= check(content.find("<v Speaker 1>good evening everyone</v>") != std::string::npos,
                "voice span for speaker cue");
    ok &= check(std::get<VttEntry>(track.entries()[1]).voice ==
                    std::optional<std::string>("Speaker 0"),
                "voice stored on the entry");
    return ok;
}

bool test_ass_styles_per_speaker() {
    auto track = assemble_track(two_speaker_transcript(), TrackFormat::Ass);
    const std::string content = track.content();
    bool ok = true;
    ok &= check(count_occurrences(content, "Style: Default,") == 1, "one default style");
    ok &= check(count_occurrences(content, "Style: ") == 3, "two speaker styles");
    const auto &first = std::get<AssEntry>(track.entries()[0]);
    ok &= check(first.style == "Speaker_01", "entry uses its speaker style");
    ok &= check(first.name == "Speaker 1", "entry name is the display name");
    const std::string tag = "{\\c&H" + ass_bgr_for_color(color_for("SPEAKER_01")) + "&}";
    ok &= check(first.styled_text == tag + "good evening everyone", "inline color override");
    return ok;
}

bool test_empty_transcript() {
    Transcript empty;
    bool ok = true;
    auto vtt = assemble_track(empty, TrackFormat::Vtt);
    ok &= check(vtt.entries().empty(), "no entries");
    ok &= check(vtt.metadata().duration == 0.0 && vtt.metadata().word_count == 0, "zero totals");
    ok &= check(vtt.content() == "WEBVTT\n\n", "empty vtt document");
    ok &= check(assemble_track(empty, TrackFormat::Srt).content().empty(), "empty srt document");
    const auto ass = assemble_track(empty, TrackFormat::Ass).content();
    ok &= check(count_occurrences(ass, "Style: ") == 1, "empty ass keeps the default style");
    return ok;
}

bool test_schema_error_fails_fast() {
    Transcript t;
    t.segments.push_back(text_segment("backwards", 3.0, 2.0));
    try {
        assemble_track(t, TrackFormat::Srt);
    } catch (const SchemaValidationError &) {
        return true;
    }
    return check(false, "inverted segment accepted");
}

bool test_blank_speakers_are_unattributed() {
    Transcript t;
    t.segments.push_back(text_segment("hello there", 0.0, 2.0, ""));
    t.segments.push_back(timed_segment({"next", "one"}, 3.0, 0.5, " "));
    AssembleOptions opts;
    opts.include_speaker_prefix = true;

    auto srt = assemble_track(t, TrackFormat::Srt, opts);
    bool ok = check(srt.metadata().speakers.empty(), "blank ids are not registered");
    ok &= check(srt.content().find("[") == std::string::npos,
                "no prefix for blank speaker, got:\n" + srt.content());
    ok &= check(srt.content().find("hello there") != std::string::npos, "text kept");

    const std::string vtt = assemble_track(t, TrackFormat::Vtt, AssembleOptions{}).content();
    ok &= check(vtt.find("<v") == std::string::npos, "no voice span, got:\n" + vtt);

    const std::string ass = assemble_track(t, TrackFormat::Ass, AssembleOptions{}).content();
    ok &= check(count_occurrences(ass, "Style: ") == 1, "only the default style");
    ok &= check(count_occurrences(ass, ",Default,,0,0,0,,") == 2, "cues use the default style");

    const auto stats = compute_transcript_stats(t);
    ok &= check(stats.speaker_segments.size() == 1 &&
                    stats.speaker_segments.count(kUnknownSpeaker) == 1,
                "blank speakers counted as unknown");
    return ok;
}

bool test_deterministic_content() {
    AssembleOptions opts;
    opts.include_speaker_prefix = true;
    const auto a = assemble_track(two_speaker_transcript(), TrackFormat::Ass, opts).content();
    const auto b = assemble_track(two_speaker_transcript(), TrackFormat::Ass, opts).content();
    return check(a == b, "repeated assembly is byte-identical");
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_metadata();
    ok &= test_speaker_prefix();
    ok &= test_numeric_labels();
    ok &= test_vtt_voices();
    ok &= test_ass_styles_per_speaker();
    ok &= test_empty_transcript();
    ok &= test_schema_error_fails_fast();
    ok &= test_blank_speakers_are_unattributed();
    ok &= test_deterministic_content();
    return ok ? 0 : 1;
}

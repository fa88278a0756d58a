// Renders the sample meeting transcript in every format and checks structural
// properties of the chunking and of each document. argv[1] is the testdata dir.
#include <cstdio>
#include <exception>
#include <string>
#include <vector>

#include "chunker.hpp"
#include "logging.hpp"
#include "render_options.hpp"
#include "subforge.hpp"
#include "subtitle_renderers.hpp"
#include "text_utils.hpp"
#include "transcript_loader.hpp"
#include "transcript_test_utils.hpp"

using namespace subforge;
using transcript_test_utils::count_occurrences;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        fprintf(stderr, "[fixture_render] FAIL: %s\n", msg.c_str());
    }
    return cond;
}

bool check_chunks(const std::vector<Chunk> &chunks, const ChunkOptions &opts) {
    bool ok = check(!chunks.empty(), "fixture produces chunks");
    for (size_t i = 0; i < chunks.size(); ++i) {
        const auto &c = chunks[i];
        const std::string tag = "chunk " + std::to_string(i) + " '" + c.text + "'";
        ok &= check(!trim_copy(c.text).empty(), tag + ": empty text");
        ok &= check(c.end >= c.start, tag + ": ends before it starts");
        if (i > 0) {
            ok &= check(chunks[i - 1].start <= c.start, tag + ": out of order");
        }
        const bool single_token = split_whitespace(c.text).size() == 1;
        ok &= check(single_token || utf8_length(c.text) <= opts.max_length,
                    tag + ": exceeds max_length");
        if (!c.words.empty()) {
            ok &= check(c.words.size() <= opts.max_words, tag + ": exceeds max_words");
            ok &= check(c.words.size() == 1 ||
                            c.words.back().end - c.words.front().start <= opts.max_duration + 1e-9,
                        tag + ": exceeds max_duration");
            for (const auto &w : c.words) {
                ok &= check(w.speaker == c.speaker, tag + ": mixes speakers");
            }
        }
    }
    return ok;
}

bool check_srt(const std::string &srt, size_t cue_count) {
    bool ok = check(count_occurrences(srt, " --> ") == cue_count, "srt cue count");
    size_t pos = 0;
    for (size_t i = 1; i <= cue_count && ok; ++i) {
        const std::string marker = std::to_string(i) + "\n";
        const size_t found = srt.find(marker, pos);
        ok &= check(found != std::string::npos && (found == 0 || srt[found - 1] == '\n'),
                    "srt index " + std::to_string(i) + " in sequence");
        pos = found + marker.size();
    }
    return ok;
}

bool render_defaults(const Transcript &transcript) {
    const ChunkOptions opts;
    const auto chunks = chunk_transcript(transcript, opts);
    bool ok = check_chunks(chunks, opts);

    const std::string srt = render_transcript(transcript, TrackFormat::Srt);
    ok &= check_srt(srt, chunks.size());
    ok &= check(srt.find("Mm-hmm.") == std::string::npos, "degenerate segment dropped");
    ok &= check(srt.find("3.5 percent") != std::string::npos, "decimal stays whole");
    ok &= check(srt.find("Seconded.") != std::string::npos, "unattributed segment kept");

    const std::string vtt = render_transcript(transcript, TrackFormat::Vtt);
    ok &= check(vtt.rfind("WEBVTT\n\n", 0) == 0, "vtt header");
    ok &= check(count_occurrences(vtt, " --> ") == chunks.size(), "vtt cue count");
    ok &= check(vtt.find("<v Speaker 0>Good evening") != std::string::npos, "vtt voice span");
    ok &= check(vtt.find("clerk&apos;s") == std::string::npos &&
                    vtt.find("clerk's office.") != std::string::npos,
                "apostrophes are not escaped");

    const std::string ass = render_transcript(transcript, TrackFormat::Ass);
    ok &= check(count_occurrences(ass, "\nStyle: ") == 3, "default style plus one per speaker");
    ok &= check(count_occurrences(ass, "\nDialogue: ") == chunks.size(), "ass dialogue count");
    ok &= check(ass.find("[Script Info]") != std::string::npos &&
                    ass.find("[V4+ Styles]") != std::string::npos &&
                    ass.find("[Events]") != std::string::npos,
                "ass sections");
    return ok;
}

bool render_with_config(const std::string &dir) {
    RenderOptions options;
    auto status = load_render_options_file(dir + "/render_config.json", options);
    bool ok = check(status.ok, "sample config loads: " + status.message);
    if (!ok) {
        return false;
    }
    ok &= check(options.format == TrackFormat::Ass, "sample config selects ass");

    auto res = render_transcript_file(dir + "/meeting.diarized.json",
                                      std::string(track_format_name(*options.format)),
                                      options.assemble);
    ok &= check(res.status.ok, "configured render: " + res.status.message);
    ok &= check(res.content.find("Title: City council, October session\n") != std::string::npos,
                "title from config");
    ok &= check(res.content.find("DejaVu Sans,28") != std::string::npos, "style from config");
    ok &= check(res.content.find("[Speaker 1] Good evening") != std::string::npos,
                "numeric speaker prefix");
    ok &= check(res.content.find("[Speaker 2] Thank you,") != std::string::npos,
                "second speaker prefix");

    const auto chunks = chunk_transcript(load_transcript_file(dir + "/meeting.diarized.json"),
                                         options.assemble.chunking);
    ok &= check_chunks(chunks, options.assemble.chunking);
    ok &= check(count_occurrences(res.content, "\nDialogue: ") == chunks.size(),
                "configured dialogue count");
    return ok;
}

}  // namespace

int main(int argc, char **argv) {
    if (argc < 2) {
        fprintf(stderr, "usage: fixture_render <testdata-dir>\n");
        return 2;
    }
    set_log_verbosity(LogVerbosity::Warn);
    const std::string dir = argv[1];
    bool ok = true;
    try {
        const Transcript transcript = load_transcript_file(dir + "/meeting.diarized.json");
        ok &= render_defaults(transcript);
        ok &= render_with_config(dir);
    } catch (const std::exception &e) {
        fprintf(stderr, "[fixture_render] FAIL: %s\n", e.what());
        ok = false;
    }
    return ok ? 0 : 1;
}

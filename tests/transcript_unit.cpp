// Transcript JSON parsing, schema validation and statistics.
#include <cstdio>
#include <optional>
#include <string>

#include "subtitle_errors.hpp"
#include "transcript.hpp"
#include "transcript_loader.hpp"
#include "transcript_test_utils.hpp"

using namespace subforge;
using transcript_test_utils::near;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        fprintf(stderr, "[transcript_unit] FAIL: %s\n", msg.c_str());
    }
    return cond;
}

// Returns the SchemaValidationError message, or "" when parsing succeeded.
std::string schema_error_of(const std::string &json_text) {
    try {
        parse_transcript_json(json_text);
    } catch (const SchemaValidationError &e) {
        return e.what();
    }
    return {};
}

bool test_parse_valid() {
    const std::string doc = R"({
        "language": "de",
        "segments": [
            {"id": 7, "start": 0.5, "end": 2.0, "text": " Hallo zusammen ", "speaker": "SPEAKER_00",
             "words": [
                {"word": " Hallo", "start": 0.5, "end": 1.0, "probability": 0.98},
                {"word": " zusammen", "start": 1.0, "end": 2.0, "speaker": "SPEAKER_01"}
             ]},
            {"start": 3.0, "end": 4.0, "text": "Ohne Wörter"}
        ]
    })";
    Transcript t = parse_transcript_json(doc);
    bool ok = true;
    ok &= check(t.language == "de", "language parsed");
    ok &= check(t.segments.size() == 2, "two segments");
    const auto &s0 = t.segments[0];
    ok &= check(s0.id && *s0.id == 7, "segment id parsed");
    ok &= check(near(s0.start, 0.5) && near(s0.end, 2.0), "segment timing parsed");
    ok &= check(s0.speaker && *s0.speaker == "SPEAKER_00", "segment speaker parsed");
    ok &= check(s0.words && s0.words->size() == 2, "words parsed");
    ok &= check((*s0.words)[0].probability && near(*(*s0.words)[0].probability, 0.98),
                "probability parsed");
    ok &= check(!(*s0.words)[0].speaker, "word speaker optional");
    ok &= check((*s0.words)[1].speaker && *(*s0.words)[1].speaker == "SPEAKER_01",
                "word speaker parsed");
    const auto &s1 = t.segments[1];
    ok &= check(!s1.id && !s1.speaker && !s1.words, "optional fields absent");
    return ok;
}

bool test_blank_speaker_is_absent() {
    Transcript t = parse_transcript_json(R"({"segments": [
        {"start": 0.0, "end": 1.0, "text": "hi", "speaker": "",
         "words": [{"word": "hi", "start": 0.0, "end": 1.0, "speaker": "  "}]},
        {"start": 1.0, "end": 2.0, "text": "yes", "speaker": " SPEAKER_02"}
    ]})");
    bool ok = check(!t.segments[0].speaker, "empty segment speaker dropped");
    ok &= check(!(*t.segments[0].words)[0].speaker, "whitespace word speaker dropped");
    ok &= check(t.segments[1].speaker == std::optional<std::string>(" SPEAKER_02"),
                "non-blank ids kept verbatim");
    ok &= check(!attributed_speaker(std::string("\t")) &&
                    attributed_speaker(std::string("x")) == std::optional<std::string>("x"),
                "attributed_speaker");
    return ok;
}

bool test_language_defaults_to_en() {
    Transcript t = parse_transcript_json(R"({"segments": []})");
    return check(t.language == "en" && t.segments.empty(), "missing language defaults to en");
}

bool test_schema_errors() {
    bool ok = true;
    auto has = [](const std::string &msg, const std::string &needle) {
        return msg.find(needle) != std::string::npos;
    };
    std::string msg = schema_error_of(R"({"segments": [{"start": 1.0, "text": "x"}]})");
    ok &= check(has(msg, "segments[0].end"), "missing end reported with path, got: " + msg);

    msg = schema_error_of(R"({"segments": [{"start": 2.0, "end": 1.0, "text": "x"}]})");
    ok &= check(has(msg, "segments[0].end"), "end before start rejected, got: " + msg);

    msg = schema_error_of(R"({"segments": [{"start": "0", "end": 1.0, "text": "x"}]})");
    ok &= check(has(msg, "segments[0].start"), "string timing rejected, got: " + msg);

    msg = schema_error_of(R"({"segments": [{"start": 0, "end": 1.0, "text": "a b",
        "words": [{"word": "a", "start": 0, "end": 0.5}, {"word": "b", "start": 0.9, "end": 0.6}]}]})");
    ok &= check(has(msg, "segments[0].words[1].end"), "inverted word timing rejected, got: " + msg);

    msg = schema_error_of(R"({"segments": [{"start": 0, "end": 1.0, "text": "a",
        "words": [{"start": 0, "end": 0.5}]}]})");
    ok &= check(has(msg, "segments[0].words[0].word"), "missing word text rejected, got: " + msg);

    msg = schema_error_of(R"({"language": "en"})");
    ok &= check(has(msg, "segments"), "missing segments rejected, got: " + msg);

    msg = schema_error_of("{not json");
    ok &= check(has(msg, "invalid JSON"), "malformed JSON rejected, got: " + msg);
    return ok;
}

bool test_validate_in_memory() {
    Transcript t;
    t.segments.push_back(transcript_test_utils::text_segment("ok", 0.0, 1.0));
    t.segments.push_back(transcript_test_utils::text_segment("bad", 5.0, 4.0));
    try {
        validate_transcript(t);
    } catch (const SchemaValidationError &e) {
        return check(std::string(e.what()).find("segments[1]") != std::string::npos,
                     "in-memory validation names the segment");
    }
    return check(false, "in-memory validation accepted end < start");
}

bool test_stats() {
    Transcript t;
    t.segments.push_back(
        transcript_test_utils::timed_segment({"one", "two", "three"}, 0.0, 0.5, "SPEAKER_00"));
    t.segments.push_back(transcript_test_utils::text_segment("four five", 2.0, 3.0, "SPEAKER_01"));
    t.segments.push_back(transcript_test_utils::text_segment("six", 3.0, 4.0));
    auto stats = compute_transcript_stats(t);
    bool ok = true;
    ok &= check(stats.segment_count == 3, "segment count");
    ok &= check(stats.total_words == 6, "total words mixes timed and untimed segments");
    ok &= check(stats.speaker_words["SPEAKER_00"] == 3, "words for SPEAKER_00");
    ok &= check(stats.speaker_words["SPEAKER_01"] == 2, "words for SPEAKER_01");
    ok &= check(stats.speaker_segments[kUnknownSpeaker] == 1, "unattributed segment counted");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_parse_valid();
    ok &= test_blank_speaker_is_absent();
    ok &= test_language_defaults_to_en();
    ok &= test_schema_errors();
    ok &= test_validate_in_memory();
    ok &= test_stats();
    return ok ? 0 : 1;
}

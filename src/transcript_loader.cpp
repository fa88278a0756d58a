//
//  transcript_loader.cpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "transcript_loader.hpp"

#include <cerrno>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <system_error>

#include "logging.hpp"
#include "subtitle_errors.hpp"

using json = nlohmann::json;

namespace subforge {

namespace {

const json &require(const json &obj, const char *key, const std::string &where) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        throw SchemaValidationError(where + "." + key + ": missing required field");
    }
    return *it;
}

double require_number(const json &obj, const char *key, const std::string &where) {
    const json &v = require(obj, key, where);
    if (!v.is_number()) {
        throw SchemaValidationError(where + "." + key + ": expected a number");
    }
    return v.get<double>();
}

std::string require_string(const json &obj, const char *key, const std::string &where) {
    const json &v = require(obj, key, where);
    if (!v.is_string()) {
        throw SchemaValidationError(where + "." + key + ": expected a string");
    }
    return v.get<std::string>();
}

std::optional<std::string> optional_string(const json &obj, const char *key,
                                           const std::string &where) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw SchemaValidationError(where + "." + key + ": expected a string");
    }
    return it->get<std::string>();
}

Word parse_word(const json &j, const std::string &where) {
    if (!j.is_object()) {
        throw SchemaValidationError(where + ": expected an object");
    }
    Word w;
    w.word = require_string(j, "word", where);
    w.start = require_number(j, "start", where);
    w.end = require_number(j, "end", where);
    w.speaker = attributed_speaker(optional_string(j, "speaker", where));
    auto p = j.find("probability");
    if (p != j.end() && !p->is_null()) {
        if (!p->is_number()) {
            throw SchemaValidationError(where + ".probability: expected a number");
        }
        w.probability = p->get<double>();
    }
    return w;
}

Segment parse_segment(const json &j, const std::string &where) {
    if (!j.is_object()) {
        throw SchemaValidationError(where + ": expected an object");
    }
    Segment seg;
    auto id = j.find("id");
    if (id != j.end() && !id->is_null()) {
        if (!id->is_number_integer()) {
            throw SchemaValidationError(where + ".id: expected an integer");
        }
        seg.id = id->get<int>();
    }
    seg.start = require_number(j, "start", where);
    seg.end = require_number(j, "end", where);
    seg.text = require_string(j, "text", where);
    seg.speaker = attributed_speaker(optional_string(j, "speaker", where));
    auto words = j.find("words");
    if (words != j.end() && !words->is_null()) {
        if (!words->is_array()) {
            throw SchemaValidationError(where + ".words: expected an array");
        }
        std::vector<Word> parsed;
        parsed.reserve(words->size());
        for (size_t i = 0; i < words->size(); ++i) {
            parsed.push_back(parse_word((*words)[i], where + ".words[" + std::to_string(i) + "]"));
        }
        seg.words = std::move(parsed);
    }
    return seg;
}

Transcript transcript_from_json(const json &j) {
    if (!j.is_object()) {
        throw SchemaValidationError("transcript: expected a JSON object");
    }
    Transcript t;
    auto lang = optional_string(j, "language", "transcript");
    if (lang) {
        t.language = *lang;
    }
    auto segs = j.find("segments");
    if (segs == j.end() || !segs->is_array()) {
        throw SchemaValidationError("transcript.segments: missing or not an array");
    }
    t.segments.reserve(segs->size());
    for (size_t i = 0; i < segs->size(); ++i) {
        t.segments.push_back(parse_segment((*segs)[i], "segments[" + std::to_string(i) + "]"));
    }
    validate_transcript(t);
    return t;
}

}  // namespace

Transcript parse_transcript_json(const std::string &json_text) {
    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::parse_error &e) {
        throw SchemaValidationError(std::string("transcript: invalid JSON: ") + e.what());
    }
    return transcript_from_json(j);
}

Transcript load_transcript_file(const std::string &path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::ostringstream oss;
        oss << "open failed for " << path << " errno=" << errno << " ("
            << std::generic_category().message(errno) << ")";
        SF_LOG("error", oss.str());
        throw std::runtime_error(oss.str());
    }
    std::ostringstream buf;
    buf << f.rdbuf();
    SF_LOG("io", "read transcript " << path << " (" << buf.str().size() << " bytes)");
    return parse_transcript_json(buf.str());
}

}  // namespace subforge

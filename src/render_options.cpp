//
//  render_options.cpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "render_options.hpp"

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <system_error>

#include "logging.hpp"
#include "subtitle_errors.hpp"
#include "text_utils.hpp"

using json = nlohmann::json;

namespace subforge {

namespace {

RenderStatus make_status(bool ok, std::string msg = {}) { return RenderStatus{ok, std::move(msg)}; }

template <typename T>
void read_if_present(const json &j, const char *key, T &out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

size_t read_positive_count(const json &j, const char *key, size_t current) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return current;
    }
    const long long v = it->get<long long>();
    if (v <= 0) {
        throw std::invalid_argument(std::string(key) + " must be positive");
    }
    return static_cast<size_t>(v);
}

void apply_style(const json &j, AssStyle &s) {
    read_if_present(j, "font_name", s.font_name);
    read_if_present(j, "font_size", s.font_size);
    read_if_present(j, "primary_color", s.primary_color);
    read_if_present(j, "secondary_color", s.secondary_color);
    read_if_present(j, "outline_color", s.outline_color);
    read_if_present(j, "back_color", s.back_color);
    read_if_present(j, "back_alpha", s.back_alpha);
    read_if_present(j, "bold", s.bold);
    read_if_present(j, "italic", s.italic);
    read_if_present(j, "underline", s.underline);
    read_if_present(j, "strike_out", s.strike_out);
    read_if_present(j, "scale_x", s.scale_x);
    read_if_present(j, "scale_y", s.scale_y);
    read_if_present(j, "spacing", s.spacing);
    read_if_present(j, "angle", s.angle);
    read_if_present(j, "border_style", s.border_style);
    read_if_present(j, "outline", s.outline);
    read_if_present(j, "shadow", s.shadow);
    read_if_present(j, "alignment", s.alignment);
    read_if_present(j, "margin_l", s.margin_l);
    read_if_present(j, "margin_r", s.margin_r);
    read_if_present(j, "margin_v", s.margin_v);
    read_if_present(j, "encoding", s.encoding);
}

void apply_json(const json &j, RenderOptions &options) {
    if (!j.is_object()) {
        throw std::invalid_argument("config must be a JSON object");
    }
    auto &a = options.assemble;
    auto &c = a.chunking;

    auto fmt = j.find("format");
    if (fmt != j.end() && !fmt->is_null()) {
        options.format = parse_track_format(fmt->get<std::string>());
    }
    read_if_present(j, "max_duration", c.max_duration);
    read_if_present(j, "min_duration", c.min_duration);
    c.max_length = read_positive_count(j, "max_length", c.max_length);
    c.max_words = read_positive_count(j, "max_words", c.max_words);
    read_if_present(j, "include_speaker_prefix", a.include_speaker_prefix);

    auto labels = j.find("speaker_labels");
    if (labels != j.end() && !labels->is_null()) {
        const std::string mode = to_lower_ascii(labels->get<std::string>());
        if (mode == "numeric") {
            a.speaker_labels = SpeakerLabelMode::Numeric;
        } else if (mode == "normalized") {
            a.speaker_labels = SpeakerLabelMode::Normalized;
        } else {
            throw std::invalid_argument("speaker_labels must be 'normalized' or 'numeric', got '" +
                                        mode + "'");
        }
    }
    auto colors = j.find("speaker_colors");
    if (colors != j.end() && !colors->is_null()) {
        for (auto it = colors->begin(); it != colors->end(); ++it) {
            a.speaker_colors[it.key()] = it.value().get<std::string>();
        }
    }
    auto title = j.find("title");
    if (title != j.end() && !title->is_null()) {
        a.title = title->get<std::string>();
    }
    auto style = j.find("style");
    if (style != j.end() && !style->is_null()) {
        AssStyle s = a.style.value_or(AssStyle{});
        apply_style(*style, s);
        a.style = s;
    }
}

}  // namespace

RenderStatus apply_render_options_json(const std::string &json_text, RenderOptions &options) {
    try {
        apply_json(json::parse(json_text), options);
    } catch (const json::exception &e) {
        SF_LOG("error", "config: " << e.what());
        return make_status(false, std::string("config: ") + e.what());
    } catch (const std::invalid_argument &e) {
        SF_LOG("error", "config: " << e.what());
        return make_status(false, std::string("config: ") + e.what());
    }
    return make_status(true);
}

RenderStatus load_render_options_file(const std::string &path, RenderOptions &options) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::ostringstream oss;
        oss << "open failed for " << path << " errno=" << errno << " ("
            << std::generic_category().message(errno) << ")";
        SF_LOG("error", oss.str());
        return make_status(false, oss.str());
    }
    std::ostringstream buf;
    buf << f.rdbuf();
    SF_LOG("io", "read config " << path);
    return apply_render_options_json(buf.str(), options);
}

std::optional<TrackFormat> format_from_extension(const std::string &path) {
    const std::string ext = to_lower_ascii(std::filesystem::path(path).extension().string());
    if (ext.size() < 2) {
        return std::nullopt;
    }
    try {
        return parse_track_format(ext.substr(1));
    } catch (const UnsupportedFormat &) {
        return std::nullopt;
    }
}

}  // namespace subforge

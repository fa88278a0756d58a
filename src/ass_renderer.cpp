//
//  ass_renderer.cpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include <iomanip>
#include <set>
#include <sstream>

#include "logging.hpp"
#include "speaker_colors.hpp"
#include "subtitle_renderers.hpp"
#include "subtitle_timing.hpp"
#include "text_utils.hpp"

namespace subforge {

namespace {

constexpr const char *kStyleFormat =
    "Format: Name, Fontname, Fontsize, PrimaryColour, SecondaryColour, OutlineColour, "
    "BackColour, Bold, Italic, Underline, StrikeOut, ScaleX, ScaleY, Spacing, Angle, "
    "BorderStyle, Outline, Shadow, Alignment, MarginL, MarginR, MarginV, Encoding";

constexpr const char *kEventFormat =
    "Format: Layer, Start, End, Style, Name, MarginL, MarginR, MarginV, Effect, Text";

// Commas delimit ASS fields; they cannot appear inside a name.
std::string sanitize_field(std::string_view s) {
    std::string out(s);
    for (auto &c : out) {
        if (c == ',' || c == '\n' || c == '\r') {
            c = '_';
        }
    }
    return out;
}

// Script Info values end at the line break; CR/LF would start a new entry.
std::string single_line(std::string_view s) {
    std::string out(s);
    for (auto &c : out) {
        if (c == '\n' || c == '\r') {
            c = ' ';
        }
    }
    return out;
}

std::string hex_byte(int value) {
    if (value < 0) value = 0;
    if (value > 255) value = 255;
    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setw(2) << std::setfill('0') << value;
    return oss.str();
}

int ass_bool(bool v) { return v ? -1 : 0; }

std::string style_line(const std::string &name, const AssStyle &s, const std::string &primary) {
    std::ostringstream oss;
    oss << "Style: " << sanitize_field(name) << "," << sanitize_field(s.font_name) << ","
        << s.font_size << ",&H00" << primary << ",&H00" << ass_bgr_for_color(s.secondary_color)
        << ",&H00" << ass_bgr_for_color(s.outline_color) << ",&H" << hex_byte(s.back_alpha)
        << ass_bgr_for_color(s.back_color) << "," << ass_bool(s.bold) << ","
        << ass_bool(s.italic) << "," << ass_bool(s.underline) << "," << ass_bool(s.strike_out)
        << "," << s.scale_x << "," << s.scale_y << "," << s.spacing << "," << s.angle << ","
        << s.border_style << "," << s.outline << "," << s.shadow << "," << s.alignment << ","
        << s.margin_l << "," << s.margin_r << "," << s.margin_v << "," << s.encoding;
    return oss.str();
}

std::string speaker_color(const TrackMetadata &metadata, const std::string &speaker_id) {
    auto it = metadata.speakers.find(speaker_id);
    if (it != metadata.speakers.end()) {
        return it->second.color;
    }
    return color_for(speaker_id);
}

}  // namespace

std::string escape_ass_text(const std::string &text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '\n':
                out += "\\N";
                break;
            case '\r':
                break;
            case '{':
                out += "\\{";
                break;
            case '}':
                out += "\\}";
                break;
            default:
                out.push_back(c);
        }
    }
    return out;
}

std::string ass_style_name(const std::string &speaker_id) {
    std::string_view id = speaker_id;
    if (starts_with(id, "SPEAKER_") && id.size() > 8) {
        id.remove_prefix(8);
    }
    return "Speaker_" + sanitize_field(id);
}

std::map<std::string, std::string> ass_style_names(const std::vector<std::string> &speaker_ids) {
    std::map<std::string, std::string> names;
    std::set<std::string> taken{"Default"};
    for (const auto &id : speaker_ids) {
        if (names.count(id)) {
            continue;
        }
        const std::string base = ass_style_name(id);
        std::string name = base;
        for (int n = 2; !taken.insert(name).second; ++n) {
            name = base + "_" + std::to_string(n);
        }
        names.emplace(id, std::move(name));
    }
    return names;
}

Entry make_ass_entry(const Chunk &chunk, int index, size_t word_count,
                     const EntryContext &context) {
    AssEntry e;
    static_cast<EntryBase &>(e) = make_entry_base(chunk, index, word_count);
    e.styled_text = escape_ass_text(chunk.text);
    if (chunk.speaker) {
        std::vector<std::string> registered;
        registered.reserve(context.metadata.speakers.size());
        for (const auto &kv : context.metadata.speakers) {
            registered.push_back(kv.first);
        }
        const auto style_names = ass_style_names(registered);
        auto named = style_names.find(*chunk.speaker);
        e.style = named != style_names.end() ? named->second : ass_style_name(*chunk.speaker);
        auto it = context.metadata.speakers.find(*chunk.speaker);
        if (it != context.metadata.speakers.end() && it->second.display_name) {
            e.name = sanitize_field(*it->second.display_name);
        }
        const std::string bgr = ass_bgr_for_color(speaker_color(context.metadata, *chunk.speaker));
        e.styled_text = "{\\c&H" + bgr + "&}" + e.styled_text;
    }
    return e;
}

std::string render_ass(const TrackMetadata &metadata, const std::vector<Entry> &entries) {
    const AssStyle style = metadata.style.value_or(AssStyle{});

    std::ostringstream out;
    out << "[Script Info]\n";
    if (metadata.title) {
        out << "Title: " << single_line(*metadata.title) << "\n";
    }
    out << "ScriptType: v4.00+\n"
        << "PlayResX: 384\n"
        << "PlayResY: 288\n"
        << "ScaledBorderAndShadow: yes\n"
        << "\n"
        << "[V4+ Styles]\n"
        << kStyleFormat << "\n"
        << style_line("Default", style, ass_bgr_for_color(style.primary_color)) << "\n";

    // One style per distinct style name, in order of first appearance; the
    // first speaker using a name decides its color.
    std::set<std::string> seen;
    for (size_t i = 0; i < entries.size(); ++i) {
        const auto *e = std::get_if<AssEntry>(&entries[i]);
        if (!e) {
            throw_format_mismatch(TrackFormat::Ass, entries[i], i);
        }
        if (!e->speaker_id || e->style == "Default" || !seen.insert(e->style).second) {
            continue;
        }
        const std::string bgr = ass_bgr_for_color(speaker_color(metadata, *e->speaker_id));
        out << style_line(e->style, style, bgr) << "\n";
    }

    out << "\n"
        << "[Events]\n"
        << kEventFormat << "\n";
    for (const auto &entry : entries) {
        const auto &e = std::get<AssEntry>(entry);
        const std::string &text = e.styled_text.empty() ? escape_ass_text(e.text) : e.styled_text;
        out << "Dialogue: " << e.layer << "," << format_ass_time(e.start) << ","
            << format_ass_time(e.end) << "," << sanitize_field(e.style) << ","
            << sanitize_field(e.name) << "," << e.margin_l << "," << e.margin_r << ","
            << e.margin_v << "," << sanitize_field(e.effect) << "," << text << "\n";
    }
    SF_LOG("render", "ass: " << entries.size() << " dialogue lines, " << seen.size()
                             << " speaker styles");
    return out.str();
}

}  // namespace subforge

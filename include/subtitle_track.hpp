//
//  subtitle_track.hpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace subforge {

/// @ingroup api
/// Output grammar of a subtitle track.
enum class TrackFormat : uint8_t { Srt = 0, Vtt = 1, Ass = 2 };

inline constexpr size_t kTrackFormatCount = 3;

/// Case-insensitive "srt" / "vtt" / "webvtt" / "ass" / "ssa". Throws UnsupportedFormat.
TrackFormat parse_track_format(std::string_view name);

/// Canonical lower-case name ("srt", "vtt", "ass").
const char *track_format_name(TrackFormat format);

/// @ingroup api
/// A speaker seen in the transcript and how it is presented.
struct SpeakerInfo {
    std::string id;
    std::string color;                        ///< Palette name or explicit color
    std::optional<std::string> display_name;  ///< e.g. "Speaker 1"
};

/**
 * @brief Base style of an ASS track.
 *
 * Colors are BGR hex strings without prefix or alpha. `back_alpha` is the alpha
 * byte of the back color (0 opaque, 255 transparent).
 */
struct AssStyle {
    std::string font_name = "Arial";
    int font_size = 24;
    std::string primary_color = "FFFFFF";
    std::string secondary_color = "FFFFFF";
    std::string outline_color = "000000";
    std::string back_color = "000000";
    int back_alpha = 0x7F;
    bool bold = false;
    bool italic = false;
    bool underline = false;
    bool strike_out = false;
    int scale_x = 100;
    int scale_y = 100;
    int spacing = 0;
    int angle = 0;
    int border_style = 1;
    int outline = 1;
    int shadow = 0;
    int alignment = 2;  // bottom center
    int margin_l = 10;
    int margin_r = 10;
    int margin_v = 20;
    int encoding = 1;
};

/// @ingroup api
struct TrackMetadata {
    TrackFormat format = TrackFormat::Srt;
    std::string language = "en";
    std::optional<std::string> title;
    std::map<std::string, SpeakerInfo> speakers;
    std::optional<AssStyle> style;
    size_t word_count = 0;
    double duration = 0.0;
};

/// Fields shared by every cue regardless of format.
struct EntryBase {
    int index = 0;  ///< 1-based
    double start = 0.0;
    double end = 0.0;
    std::string text;
    std::optional<std::string> speaker_id;
    size_t word_count = 0;
};

struct SrtEntry : EntryBase {};

struct VttEntry : EntryBase {
    std::optional<std::string> voice;  ///< Rendered as <v voice>text</v>
};

struct AssEntry : EntryBase {
    int layer = 0;
    std::string style = "Default";
    std::string name;
    int margin_l = 0;
    int margin_r = 0;
    int margin_v = 0;
    std::string effect;
    std::string styled_text;  ///< Escaped text with override tags; rendered instead of text
};

using Entry = std::variant<SrtEntry, VttEntry, AssEntry>;

/// Common fields of any entry variant.
const EntryBase &entry_base(const Entry &entry);

/// Format an entry variant belongs to.
TrackFormat entry_format(const Entry &entry);

/**
 * @brief Immutable subtitle track: metadata plus ordered cues.
 *
 * Entries are expected to match `metadata().format`; content() throws
 * FormatMismatch otherwise.
 */
class SubtitleTrack {
   public:
    SubtitleTrack(TrackMetadata metadata, std::vector<Entry> entries);

    const TrackMetadata &metadata() const { return metadata_; }
    const std::vector<Entry> &entries() const { return entries_; }

    /// Render the complete document in the track's format.
    std::string content() const;

   private:
    TrackMetadata metadata_;
    std::vector<Entry> entries_;
};

}  // namespace subforge

//
//  main.cpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "logging.hpp"
#include "pipeline.hpp"
#include "render_options.hpp"
#include "subforge.hpp"
#include "subforge_version.hpp"
#include "subtitle_errors.hpp"
#include "transcript_loader.hpp"
#include <nlohmann/json.hpp>

namespace {

void print_usage() {
    std::cerr << "SubForge " << SUBFORGE_VERSION_DISPLAY << "\n"
              << "Copyright (c) 2025 Till Toenshoff\n\n"
              << "usage for rendering:\n"
              << "  subforge <transcript.json> <output.srt|output.vtt|output.ass|-> [options]\n"
              << "usage for statistics:\n"
              << "  subforge --stats <transcript.json>\n"
              << "Options:\n"
              << "  --format FMT          srt, vtt or ass (default: from output extension).\n"
              << "  --config FILE         JSON options file; flags below override it.\n"
              << "  --max-duration SEC    Longest cue duration (default: 5.0).\n"
              << "  --max-length N        Longest cue text in characters (default: 80).\n"
              << "  --max-words N         Most words per cue (default: 14).\n"
              << "  --min-duration SEC    Shortest duration of split cues (default: 1.0).\n"
              << "  --speaker-prefix      Prefix cue text with \"[Speaker N] \".\n"
              << "  --numeric-speakers    Number speakers in order of appearance.\n"
              << "  --title TEXT          Track title (ASS Script Info).\n"
              << "  --log-level LEVEL     error, warn, info or debug (default: info).\n";
}

bool emit_stats(const std::string &path) {
    subforge::Transcript transcript;
    try {
        transcript = subforge::load_transcript_file(path);
    } catch (const std::runtime_error &e) {
        SF_LOG("error", "subforge: failed to load transcript: " << e.what());
        return false;
    }
    const auto stats = subforge::compute_transcript_stats(transcript);
    nlohmann::json j;
    j["language"] = stats.language;
    j["segment_count"] = stats.segment_count;
    j["total_words"] = stats.total_words;
    j["speaker_counts"] = stats.speaker_segments;
    j["word_counts"] = stats.speaker_words;
    std::cout << j.dump(2) << "\n";
    return true;
}

// Value of a numeric flag; reports and returns false on garbage.
template <typename T, typename Parse>
bool parse_number(const std::string &flag, const std::string &value, T &out, Parse parse) {
    try {
        size_t used = 0;
        out = static_cast<T>(parse(value, &used));
        if (used != value.size()) {
            throw std::invalid_argument(value);
        }
    } catch (const std::exception &) {
        std::cerr << "Invalid value for " << flag << ": " << value << "\n";
        return false;
    }
    return true;
}

}  // namespace

int main(int argc, char **argv) {
    if (argc == 2 && (std::string(argv[1]) == "--version" || std::string(argv[1]) == "-v")) {
        std::cout << "SubForge " << SUBFORGE_VERSION_DISPLAY << "\n";
        return 0;
    }

    subforge::RenderOptions options;
    std::vector<std::string> positional;
    std::string config_path;
    std::string stats_path;

    // Flags are collected first so that a config file never overrides them.
    std::vector<std::pair<std::string, std::string>> overrides;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (arg == "--config" && has_value) {
            config_path = argv[++i];
        } else if (arg == "--stats" && has_value) {
            stats_path = argv[++i];
        } else if (arg == "--log-level" && has_value) {
            const auto level = subforge::parse_log_verbosity(argv[++i]);
            if (!level) {
                std::cerr << "Unknown log level: " << argv[i] << "\n";
                return 2;
            }
            subforge::set_log_verbosity(*level);
        } else if ((arg == "--format" || arg == "--max-duration" || arg == "--max-length" ||
                    arg == "--max-words" || arg == "--min-duration" || arg == "--title") &&
                   has_value) {
            overrides.emplace_back(arg, argv[++i]);
        } else if (arg == "--speaker-prefix" || arg == "--numeric-speakers") {
            overrides.emplace_back(arg, "");
        } else if (arg == "-") {
            positional.emplace_back(std::move(arg));
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return 2;
        } else {
            positional.emplace_back(std::move(arg));
        }
    }

    if (!stats_path.empty()) {
        return emit_stats(stats_path) ? 0 : 1;
    }

    if (positional.size() != 2) {
        print_usage();
        return 2;
    }
    const std::string transcript_path = positional[0];
    const std::string output_path = positional[1];

    if (!config_path.empty()) {
        auto status = subforge::load_render_options_file(config_path, options);
        if (!status.ok) {
            SF_LOG("error", "subforge: " << status.message);
            return 1;
        }
    }

    auto &chunking = options.assemble.chunking;
    for (const auto &[flag, value] : overrides) {
        bool ok = true;
        if (flag == "--format") {
            try {
                options.format = subforge::parse_track_format(value);
            } catch (const subforge::UnsupportedFormat &e) {
                std::cerr << e.what() << "\n";
                return 2;
            }
        } else if (flag == "--max-duration") {
            ok = parse_number(flag, value, chunking.max_duration,
                              [](const std::string &s, size_t *n) { return std::stod(s, n); });
        } else if (flag == "--min-duration") {
            ok = parse_number(flag, value, chunking.min_duration,
                              [](const std::string &s, size_t *n) { return std::stod(s, n); });
        } else if (flag == "--max-length" || flag == "--max-words") {
            long long count = 0;
            ok = parse_number(flag, value, count,
                              [](const std::string &s, size_t *n) { return std::stoll(s, n); });
            if (ok && count <= 0) {
                std::cerr << flag << " must be positive\n";
                ok = false;
            }
            if (ok) {
                (flag == "--max-length" ? chunking.max_length : chunking.max_words) =
                    static_cast<size_t>(count);
            }
        } else if (flag == "--title") {
            options.assemble.title = value;
        } else if (flag == "--speaker-prefix") {
            options.assemble.include_speaker_prefix = true;
        } else if (flag == "--numeric-speakers") {
            options.assemble.speaker_labels = subforge::SpeakerLabelMode::Numeric;
        }
        if (!ok) {
            return 2;
        }
    }

    const bool to_stdout = output_path == "-";
    if (!options.format) {
        options.format = subforge::format_from_extension(output_path);
    }
    if (!options.format) {
        std::cerr << "Cannot tell the subtitle format from '" << output_path
                  << "'; pass --format srt|vtt|ass.\n";
        return 2;
    }

    if (to_stdout) {
        auto res = subforge::render_transcript_file(
            transcript_path, subforge::track_format_name(*options.format), options.assemble);
        if (!res.status.ok) {
            SF_LOG("error", "subforge: failed to render subtitles: " << res.status.message);
            return 1;
        }
        std::cout << res.content;
        return 0;
    }

    subforge::FileTranscriptSource source;
    subforge::FileContentSink sink;
    auto res = subforge::publish_subtitles(source, transcript_path, sink, output_path,
                                           *options.format, options.assemble);
    if (!res.status.ok) {
        SF_LOG("error", "subforge: failed to render subtitles: " << res.status.message);
        return 1;
    }

    std::cout << "Wrote: " << res.locator << "\n";
    return 0;
}

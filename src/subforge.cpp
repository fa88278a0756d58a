//
//  subforge.cpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "subforge.hpp"
#include "subforge_version.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>

#include "logging.hpp"
#include "subtitle_errors.hpp"
#include "transcript_loader.hpp"

namespace subforge {

std::string version_string() { return SUBFORGE_VERSION_DISPLAY; }

std::string render_transcript(const Transcript &transcript, TrackFormat format,
                              const AssembleOptions &options) {
    return assemble_track(transcript, format, options).content();
}

namespace {

RenderResult make_result(bool ok, std::string msg, std::string content = {}) {
    return RenderResult{RenderStatus{ok, std::move(msg)}, std::move(content)};
}

// Runs @p load, then renders; maps the error taxonomy onto a status.
template <typename LoadFn>
RenderResult render_guarded(LoadFn &&load, const std::string &format_name,
                            const AssembleOptions &options) {
    const auto t0 = std::chrono::steady_clock::now();
    try {
        const TrackFormat format = parse_track_format(format_name);
        Transcript transcript = load();
        std::string content = render_transcript(transcript, format, options);
        const auto t1 = std::chrono::steady_clock::now();
        SF_LOG("debug", "rendered " << track_format_name(format) << " (" << content.size()
                                    << " bytes) in "
                                    << std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0)
                                           .count()
                                    << "ms");
        return make_result(true, {}, std::move(content));
    } catch (const UnsupportedFormat &e) {
        SF_LOG("error", e.what());
        return make_result(false, e.what());
    } catch (const SchemaValidationError &e) {
        SF_LOG("error", "invalid transcript: " << e.what());
        return make_result(false, std::string("invalid transcript: ") + e.what());
    } catch (const std::invalid_argument &e) {
        SF_LOG("error", "invalid options: " << e.what());
        return make_result(false, std::string("invalid options: ") + e.what());
    } catch (const std::runtime_error &e) {
        SF_LOG("error", e.what());
        return make_result(false, e.what());
    }
}

}  // namespace

RenderResult render_transcript_json(const std::string &json_text, const std::string &format_name,
                                    const AssembleOptions &options) {
    return render_guarded([&]() { return parse_transcript_json(json_text); }, format_name,
                          options);
}

RenderResult render_transcript_file(const std::string &transcript_path,
                                    const std::string &format_name,
                                    const AssembleOptions &options) {
    SF_LOG("debug", "render_transcript_file(" << transcript_path << ", " << format_name << ")");
    return render_guarded([&]() { return load_transcript_file(transcript_path); }, format_name,
                          options);
}

}  // namespace subforge

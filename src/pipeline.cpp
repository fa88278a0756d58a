//
//  pipeline.cpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "pipeline.hpp"

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "logging.hpp"
#include "subtitle_errors.hpp"
#include "subtitle_renderers.hpp"
#include "transcript_loader.hpp"

namespace subforge {

namespace {

std::filesystem::path resolve(const std::string &root, const std::string &locator) {
    std::filesystem::path p(locator);
    if (root.empty() || p.is_absolute()) {
        return p;
    }
    return std::filesystem::path(root) / p;
}

PublishResult make_result(bool ok, std::string msg, std::string locator = {}) {
    return PublishResult{RenderStatus{ok, std::move(msg)}, std::move(locator)};
}

}  // namespace

Transcript FileTranscriptSource::load(const std::string &locator) {
    return load_transcript_file(resolve(root_, locator).string());
}

std::string FileContentSink::store(const std::string &content, const std::string &destination,
                                   const std::string &content_type) {
    const std::filesystem::path path = resolve(root_, destination);
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("cannot create " + path.parent_path().string() + ": " +
                                     ec.message());
        }
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        std::ostringstream oss;
        oss << "open failed for " << path.string() << " errno=" << errno << " ("
            << std::generic_category().message(errno) << ")";
        throw std::runtime_error(oss.str());
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!out.good()) {
        throw std::runtime_error("short write to " + path.string());
    }
    SF_LOG("io", "stored " << content.size() << " bytes (" << content_type << ") at "
                           << path.string());
    return path.string();
}

PublishResult publish_subtitles(TranscriptSource &source, const std::string &locator,
                                ContentSink &sink, const std::string &destination,
                                TrackFormat format, const AssembleOptions &options) {
    const FormatRenderer &renderer = renderer_for(format);
    try {
        Transcript transcript = source.load(locator);
        const std::string content = render_transcript(transcript, format, options);
        std::string stored = sink.store(content, destination, renderer.content_type);
        SF_LOG("info", "published " << renderer.name << " subtitles for " << locator << " to "
                                    << stored);
        return make_result(true, {}, std::move(stored));
    } catch (const SchemaValidationError &e) {
        SF_LOG("error", "invalid transcript " << locator << ": " << e.what());
        return make_result(false, std::string("invalid transcript: ") + e.what());
    } catch (const std::invalid_argument &e) {
        SF_LOG("error", "invalid options: " << e.what());
        return make_result(false, std::string("invalid options: ") + e.what());
    } catch (const std::runtime_error &e) {
        SF_LOG("error", e.what());
        return make_result(false, e.what());
    }
}

}  // namespace subforge

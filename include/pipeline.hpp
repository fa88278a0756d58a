//
//  pipeline.hpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <utility>

#include "subforge.hpp"
#include "track_assembler.hpp"
#include "transcript.hpp"

namespace subforge {

/// Supplies validated transcripts by locator (a path, key, URL, ...).
class TranscriptSource {
   public:
    virtual ~TranscriptSource() = default;

    // Throws SchemaValidationError or std::runtime_error.
    virtual Transcript load(const std::string &locator) = 0;
};

/// Persists rendered content and tells where it can be retrieved.
class ContentSink {
   public:
    virtual ~ContentSink() = default;

    // Returns the locator of the stored content; throws std::runtime_error.
    virtual std::string store(const std::string &content, const std::string &destination,
                              const std::string &content_type) = 0;
};

/// Reads transcript JSON files, relative locators resolved against @p root.
class FileTranscriptSource : public TranscriptSource {
   public:
    explicit FileTranscriptSource(std::string root = {}) : root_(std::move(root)) {}

    Transcript load(const std::string &locator) override;

   private:
    std::string root_;
};

/// Writes content below @p root, creating directories as needed.
class FileContentSink : public ContentSink {
   public:
    explicit FileContentSink(std::string root = {}) : root_(std::move(root)) {}

    std::string store(const std::string &content, const std::string &destination,
                      const std::string &content_type) override;

   private:
    std::string root_;
};

struct PublishResult {
    RenderStatus status;
    std::string locator;  ///< Where the sink stored the document
};

/**
 * @brief Load a transcript, render it and hand the document to a sink.
 *
 * The only place where I/O meets the pure core; all failures end up in the status.
 */
PublishResult publish_subtitles(TranscriptSource &source, const std::string &locator,
                                ContentSink &sink, const std::string &destination,
                                TrackFormat format,
                                const AssembleOptions &options = AssembleOptions{});

}  // namespace subforge

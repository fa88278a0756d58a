//
//  subtitle_errors.hpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <stdexcept>
#include <string>

namespace subforge {

/// Malformed transcript (missing timing fields, end < start, wrong JSON types).
class SchemaValidationError : public std::runtime_error {
   public:
    explicit SchemaValidationError(const std::string &what) : std::runtime_error(what) {}
};

/// Entries of one format handed to the renderer of another.
class FormatMismatch : public std::logic_error {
   public:
    explicit FormatMismatch(const std::string &what) : std::logic_error(what) {}
};

/// Requested output format is not one of srt/vtt/ass.
class UnsupportedFormat : public std::invalid_argument {
   public:
    explicit UnsupportedFormat(const std::string &what) : std::invalid_argument(what) {}
};

}  // namespace subforge

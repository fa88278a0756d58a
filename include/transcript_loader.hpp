//
//  transcript_loader.hpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>

#include "transcript.hpp"

namespace subforge {

// Parse a transcript JSON document and validate it. Throws SchemaValidationError
// for malformed JSON, missing required fields, wrong types or inverted timing.
Transcript parse_transcript_json(const std::string &json_text);

// Same as parse_transcript_json, reading from a file. Open failures are
// reported as std::runtime_error.
Transcript load_transcript_file(const std::string &path);

}  // namespace subforge

//
//  logging.hpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

namespace subforge {

enum class LogVerbosity { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Global threshold; messages above it are dropped before formatting.
void set_log_verbosity(LogVerbosity level);
LogVerbosity get_log_verbosity();

// "error", "warn"/"warning", "info", "debug"; nullopt for anything else.
std::optional<LogVerbosity> parse_log_verbosity(std::string_view name);

// Severity of a log tag. Pipeline stage tags (chunker, render, io) and
// unknown tags rank as debug.
LogVerbosity severity_for_tag(std::string_view tag);

// Redirect log output (nullptr restores std::cerr). The stream must outlive
// its use as the sink.
void set_log_stream(std::ostream *stream);

bool log_enabled(const char *tag);
void log_message(const char *tag, const std::string &msg, const char *file, int line,
                 const char *func);

}  // namespace subforge

#define SF_LOG(level, message)                                                    \
    do {                                                                          \
        if (subforge::log_enabled(level)) {                                       \
            std::ostringstream _sf_log_ss;                                        \
            _sf_log_ss << message;                                                \
            subforge::log_message(level, _sf_log_ss.str(), __FILE__, __LINE__,    \
                                  __func__);                                      \
        }                                                                         \
    } while (0)

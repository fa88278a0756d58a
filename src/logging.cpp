//
//  logging.cpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "logging.hpp"

#include <array>
#include <atomic>
#include <iostream>
#include <mutex>
#include <utility>

namespace subforge {

namespace {

std::atomic<int> g_log_level{static_cast<int>(LogVerbosity::Info)};
std::atomic<std::ostream *> g_log_stream{nullptr};
std::mutex g_log_mutex;

constexpr std::array<std::pair<std::string_view, LogVerbosity>, 5> kLevelNames{{
    {"error", LogVerbosity::Error},
    {"warn", LogVerbosity::Warn},
    {"warning", LogVerbosity::Warn},
    {"info", LogVerbosity::Info},
    {"debug", LogVerbosity::Debug},
}};

}  // namespace

void set_log_verbosity(LogVerbosity level) {
    g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogVerbosity get_log_verbosity() {
    return static_cast<LogVerbosity>(g_log_level.load(std::memory_order_relaxed));
}

std::optional<LogVerbosity> parse_log_verbosity(std::string_view name) {
    for (const auto &[key, level] : kLevelNames) {
        if (key == name) {
            return level;
        }
    }
    return std::nullopt;
}

LogVerbosity severity_for_tag(std::string_view tag) {
    return parse_log_verbosity(tag).value_or(LogVerbosity::Debug);
}

void set_log_stream(std::ostream *stream) { g_log_stream.store(stream); }

bool log_enabled(const char *tag) {
    const auto sev = severity_for_tag(tag ? tag : "");
    return static_cast<int>(sev) <= g_log_level.load(std::memory_order_relaxed);
}

void log_message(const char *tag, const std::string &msg, const char *file, int line,
                 const char *func) {
    const std::string_view t(tag ? tag : "");
    std::ostream *out = g_log_stream.load();
    if (!out) {
        out = &std::cerr;
    }
    std::lock_guard<std::mutex> lock(g_log_mutex);
    *out << "[SubForge][" << t << "]";
    // Errors carry their origin; stage chatter stays short.
    if (severity_for_tag(t) == LogVerbosity::Error) {
        *out << "[" << file << ":" << line << " " << func << "]";
    }
    *out << " " << msg << std::endl;
}

}  // namespace subforge

//
//  subtitle_timing.cpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "subtitle_timing.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace subforge {

namespace {

// Absorbs binary representation error (1.001 * 1000 == 1000.9999...) before truncation.
constexpr double kTruncationEpsilon = 1e-6;

std::string format_hms(double seconds, char fraction_separator, int64_t units_per_second,
                       int fraction_digits, int hour_width) {
    const int64_t units = truncate_to_units(seconds, units_per_second);
    const int64_t fraction = units % units_per_second;
    const int64_t total_seconds = units / units_per_second;
    const int64_t hours = total_seconds / 3600;
    const int64_t minutes = (total_seconds % 3600) / 60;
    const int64_t secs = total_seconds % 60;

    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(hour_width) << hours << ':' << std::setw(2) << minutes
        << ':' << std::setw(2) << secs << fraction_separator << std::setw(fraction_digits)
        << fraction;
    return oss.str();
}

}  // namespace

int64_t truncate_to_units(double seconds, int64_t units_per_second) {
    if (!std::isfinite(seconds) || seconds <= 0.0) {
        return 0;
    }
    return static_cast<int64_t>(
        std::floor(seconds * static_cast<double>(units_per_second) + kTruncationEpsilon));
}

std::string format_srt_time(double seconds) { return format_hms(seconds, ',', 1000, 3, 2); }

std::string format_vtt_time(double seconds) { return format_hms(seconds, '.', 1000, 3, 2); }

std::string format_ass_time(double seconds) { return format_hms(seconds, '.', 100, 2, 1); }

}  // namespace subforge

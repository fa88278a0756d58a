//
//  subtitle_timing.hpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>

namespace subforge {

// Whole units of 1/@p units_per_second in @p seconds, truncated. Negative and
// non-finite input yields 0.
int64_t truncate_to_units(double seconds, int64_t units_per_second);

// SRT: HH:MM:SS,mmm (milliseconds truncated, hour at least two digits).
std::string format_srt_time(double seconds);

// WebVTT: HH:MM:SS.mmm (milliseconds truncated, hour at least two digits).
std::string format_vtt_time(double seconds);

// ASS: H:MM:SS.cc (centiseconds truncated, hour unpadded).
std::string format_ass_time(double seconds);

}  // namespace subforge

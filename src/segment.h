// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "interval.h"

#include <string>
#include <vector>

namespace sonix {

constexpr const char* LABEL_SPEECH = "speech";
constexpr const char* LABEL_SILENCE = "silence";

struct Segment {
    double start_time_sec;
    double end_time_sec;
    std::string label;       // "speech", "silence" or a speaker id
    std::string transcript;

    double duration() const { return end_time_sec - start_time_sec; }
    bool is_silence() const { return label == LABEL_SILENCE; }
};

/// Convert merged sample intervals to time segments.
/// Speech boundaries are widened by pad_samples and clamped to [0, total];
/// silence boundaries are reported as is.
std::vector<Segment> format_segments(const std::vector<Interval>& intervals,
                                     int sample_rate, int64_t total,
                                     int64_t pad_samples = 0);

/// Format seconds as "MM:SS.mmm".
std::string format_timestamp(double seconds);

} // namespace sonix

// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "segment.h"
#include "util.h"

#include <algorithm>
#include <cstdio>

namespace sonix {

std::vector<Segment> format_segments(const std::vector<Interval>& intervals,
                                     int sample_rate, int64_t total,
                                     int64_t pad_samples) {
    if (sample_rate <= 0)
        throw AudioInputError("Sample rate must be positive, got " + std::to_string(sample_rate));

    const double sr = static_cast<double>(sample_rate);
    const int64_t pad = std::max<int64_t>(0, pad_samples);

    std::vector<Segment> segments;
    segments.reserve(intervals.size());

    for (const auto& iv : intervals) {
        int64_t s = iv.start;
        int64_t e = iv.end;
        if (iv.is_speech) {
            s = std::max<int64_t>(0, s - pad);
            e = std::min<int64_t>(total, e + pad);
        }
        segments.push_back({
            static_cast<double>(s) / sr,
            static_cast<double>(e) / sr,
            iv.is_speech ? LABEL_SPEECH : LABEL_SILENCE,
            ""
        });
    }

    return segments;
}

std::string format_timestamp(double seconds) {
    if (seconds < 0) seconds = 0;
    long ms = static_cast<long>(seconds * 1000.0 + 0.5);
    char buf[32];
    snprintf(buf, sizeof(buf), "%02ld:%02ld.%03ld", ms / 60000, (ms / 1000) % 60, ms % 1000);
    return buf;
}

} // namespace sonix

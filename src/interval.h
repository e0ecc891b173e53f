// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <cstdint>
#include <vector>

namespace sonix {

/// Labeled half-open sample range [start, end).
struct Interval {
    int64_t start;
    int64_t end;
    bool is_speech;

    int64_t length() const { return end - start; }

    bool operator==(const Interval& o) const {
        return start == o.start && end == o.end && is_speech == o.is_speech;
    }
    bool operator!=(const Interval& o) const { return !(*this == o); }
};

/// Detector output: a region classified as speech, in samples.
struct RawActiveRange {
    int64_t start_sample;
    int64_t end_sample;
};

struct MergeConfig {
    int64_t min_silence_gap_samples = 0;
    int64_t pad_samples = 0;

    /// Convert seconds-based parameters at the given sample rate (truncating).
    /// Negative durations are treated as zero.
    static MergeConfig from_seconds(double min_silence_gap_sec, double pad_sec,
                                    int sample_rate);
};

/// Build the contiguous speech/silence timeline covering [0, total).
/// ranges must be sorted, non-overlapping and within [0, total].
/// Throws IntervalError on a violated precondition.
std::vector<Interval> build_intervals(const std::vector<RawActiveRange>& ranges,
                                      int64_t total);

/// Single left-to-right pass collapsing short silences (see merge rules in
/// interval.cpp). Throws IntervalError on non-monotonic input.
std::vector<Interval> merge_intervals(const std::vector<Interval>& intervals,
                                      int64_t min_silence_gap_samples);

/// True if intervals cover [0, total) with no gap or overlap.
bool is_contiguous(const std::vector<Interval>& intervals, int64_t total);

/// Contiguous and alternating between speech and silence.
bool is_well_formed(const std::vector<Interval>& intervals, int64_t total);

} // namespace sonix

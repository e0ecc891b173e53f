// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "interval.h"
#include "util.h"

#include <algorithm>
#include <string>

namespace sonix {

namespace {

std::string describe(int64_t start, int64_t end) {
    return "[" + std::to_string(start) + ", " + std::to_string(end) + ")";
}

void check_ranges(const std::vector<RawActiveRange>& ranges, int64_t total) {
    if (total <= 0)
        throw IntervalError("Timeline length must be positive, got " + std::to_string(total));

    int64_t prev_end = 0;
    for (const auto& r : ranges) {
        if (r.start_sample < prev_end || r.end_sample <= r.start_sample || r.end_sample > total)
            throw IntervalError("Active range " + describe(r.start_sample, r.end_sample) +
                                " is unordered or outside " + describe(0, total));
        prev_end = r.end_sample;
    }
}

} // anonymous namespace

MergeConfig MergeConfig::from_seconds(double min_silence_gap_sec, double pad_sec,
                                      int sample_rate) {
    MergeConfig cfg;
    cfg.min_silence_gap_samples =
        static_cast<int64_t>(std::max(0.0, min_silence_gap_sec) * sample_rate);
    cfg.pad_samples = static_cast<int64_t>(std::max(0.0, pad_sec) * sample_rate);
    return cfg;
}

std::vector<Interval> build_intervals(const std::vector<RawActiveRange>& ranges,
                                      int64_t total) {
    check_ranges(ranges, total);

    if (ranges.empty())
        return {{0, total, false}};

    std::vector<Interval> out;
    out.reserve(ranges.size() * 2 + 1);

    if (ranges.front().start_sample > 0)
        out.push_back({0, ranges.front().start_sample, false});

    for (size_t i = 0; i < ranges.size(); ++i) {
        const auto& r = ranges[i];
        // Touching ranges continue the current speech interval
        if (!out.empty() && out.back().is_speech && out.back().end == r.start_sample)
            out.back().end = r.end_sample;
        else
            out.push_back({r.start_sample, r.end_sample, true});

        if (i + 1 < ranges.size() && ranges[i + 1].start_sample > r.end_sample)
            out.push_back({r.end_sample, ranges[i + 1].start_sample, false});
    }

    if (ranges.back().end_sample < total)
        out.push_back({ranges.back().end_sample, total, false});

    return out;
}

// Streaming reduction with one interval of lookback on the accumulated output:
//  A) silence after accumulated silence, at most min_gap long: extend that silence.
//  B) speech after accumulated silence starting at most min_gap after the silence
//     start: the silence becomes part of the speech span.
// A short silence that follows speech is only absorbed by what comes after it.
std::vector<Interval> merge_intervals(const std::vector<Interval>& intervals,
                                      int64_t min_silence_gap_samples) {
    std::vector<Interval> acc;
    acc.reserve(intervals.size());

    int64_t prev_end = 0;
    for (const auto& cur : intervals) {
        if (cur.end <= cur.start || cur.start < prev_end)
            throw IntervalError("Interval " + describe(cur.start, cur.end) +
                                " is empty or overlaps its predecessor");
        prev_end = cur.end;

        if (acc.empty() || acc.back().is_speech) {
            acc.push_back(cur);
            continue;
        }

        Interval& prev = acc.back();
        if (!cur.is_speech && cur.length() <= min_silence_gap_samples) {
            prev.end = cur.end;
        } else if (cur.is_speech && cur.start - prev.start <= min_silence_gap_samples) {
            prev.end = cur.end;
            prev.is_speech = true;
            // Keep labels alternating when the silence sat between two speech spans
            if (acc.size() >= 2 && acc[acc.size() - 2].is_speech) {
                acc[acc.size() - 2].end = cur.end;
                acc.pop_back();
            }
        } else {
            acc.push_back(cur);
        }
    }

    return acc;
}

bool is_contiguous(const std::vector<Interval>& intervals, int64_t total) {
    if (intervals.empty()) return false;
    if (intervals.front().start != 0 || intervals.back().end != total) return false;

    for (size_t i = 0; i < intervals.size(); ++i) {
        if (intervals[i].end <= intervals[i].start) return false;
        if (i > 0 && intervals[i].start != intervals[i - 1].end) return false;
    }
    return true;
}

bool is_well_formed(const std::vector<Interval>& intervals, int64_t total) {
    if (!is_contiguous(intervals, total)) return false;
    for (size_t i = 1; i < intervals.size(); ++i)
        if (intervals[i].is_speech == intervals[i - 1].is_speech) return false;
    return true;
}

} // namespace sonix

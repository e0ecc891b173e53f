// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "energy_vad.h"
#include "log.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace sonix {

namespace {

constexpr double POWER_FLOOR = 1e-10;
constexpr double DYNAMIC_RANGE_DB = 80.0;

double power_db(double power) {
    return 10.0 * std::log10(std::max(POWER_FLOOR, power));
}

} // anonymous namespace

std::vector<float> frame_rms(const std::vector<float>& samples,
                             int frame_length, int hop_length) {
    if (frame_length <= 0 || hop_length <= 0)
        throw SonixError("Frame and hop length must be positive");

    const int64_t n = static_cast<int64_t>(samples.size());
    const int64_t half = frame_length / 2;

    // prefix[i] = sum of squares of samples[0..i)
    std::vector<double> prefix(n + 1, 0.0);
    for (int64_t i = 0; i < n; ++i)
        prefix[i + 1] = prefix[i] + static_cast<double>(samples[i]) * samples[i];

    const int64_t num_frames = 1 + n / hop_length;
    std::vector<float> rms(num_frames);
    for (int64_t t = 0; t < num_frames; ++t) {
        int64_t lo = std::clamp<int64_t>(t * hop_length - half, 0, n);
        int64_t hi = std::clamp<int64_t>(t * hop_length - half + frame_length, 0, n);
        rms[t] = static_cast<float>(std::sqrt((prefix[hi] - prefix[lo]) / frame_length));
    }
    return rms;
}

std::vector<RawActiveRange> active_ranges_from_rms(const std::vector<float>& rms, int64_t total,
                                                   const EnergyVadConfig& config) {
    double peak = 0.0;
    for (float r : rms)
        peak = std::max(peak, static_cast<double>(r) * r);

    std::vector<RawActiveRange> ranges;
    if (peak <= POWER_FLOOR) {
        log_info("Energy VAD: no signal above the noise floor");
        return ranges;
    }

    const double ref_db = power_db(peak);
    const int64_t hop = config.hop_length;

    int64_t run_start = -1;
    for (int64_t t = 0; t <= static_cast<int64_t>(rms.size()); ++t) {
        bool active = t < static_cast<int64_t>(rms.size()) &&
                      power_db(static_cast<double>(rms[t]) * rms[t]) - ref_db > -config.top_db;
        if (active && run_start < 0) {
            run_start = t;
        } else if (!active && run_start >= 0) {
            int64_t s = std::min(run_start * hop, total);
            int64_t e = std::min(t * hop, total);
            if (e > s)
                ranges.push_back({s, e});
            run_start = -1;
        }
    }

    log_info("Energy VAD: %zu active range(s) in %lld frames (top_db=%.1f)",
             ranges.size(), static_cast<long long>(rms.size()), config.top_db);
    return ranges;
}

std::vector<RawActiveRange> split_nonsilent(const Waveform& wav, const EnergyVadConfig& config) {
    validate_waveform(wav);
    auto rms = frame_rms(wav.samples, config.frame_length, config.hop_length);
    return active_ranges_from_rms(rms, wav.size(), config);
}

EnergyStats energy_stats_from_rms(const std::vector<float>& rms) {
    EnergyStats stats;
    if (rms.empty()) return stats;

    std::vector<double> db(rms.size());
    double max_db = -std::numeric_limits<double>::infinity();
    for (size_t i = 0; i < rms.size(); ++i) {
        db[i] = power_db(static_cast<double>(rms[i]) * rms[i]);
        max_db = std::max(max_db, db[i]);
    }

    double sum = 0.0;
    for (auto& d : db) {
        d = std::max(d, max_db - DYNAMIC_RANGE_DB);
        sum += d;
    }
    stats.mean_db = sum / db.size();

    double var = 0.0;
    for (double d : db)
        var += (d - stats.mean_db) * (d - stats.mean_db);
    stats.variability_db = std::sqrt(var / db.size());
    return stats;
}

EnergyStats energy_stats(const std::vector<float>& samples, int frame_length, int hop_length) {
    if (samples.empty()) return {};
    return energy_stats_from_rms(frame_rms(samples, frame_length, hop_length));
}

} // namespace sonix

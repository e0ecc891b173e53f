// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "audio_file.h"
#include "interval.h"

#include <cstdint>
#include <vector>

namespace sonix {

struct EnergyVadConfig {
    float top_db = 40.0f;     // frames quieter than peak - top_db are silence
    int frame_length = 2048;
    int hop_length = 512;
};

struct EnergyStats {
    double mean_db = 0.0;
    double variability_db = 0.0;  // population standard deviation
};

/// RMS of centered, zero-padded frames: frame t covers samples
/// [t*hop - frame_length/2, t*hop + frame_length/2). Returns 1 + size/hop values.
std::vector<float> frame_rms(const std::vector<float>& samples,
                             int frame_length, int hop_length);

/// Runs of frames within top_db of the loudest frame, as sample ranges
/// clamped to total. rms comes from frame_rms() with config's hop length.
std::vector<RawActiveRange> active_ranges_from_rms(const std::vector<float>& rms, int64_t total,
                                                   const EnergyVadConfig& config);

/// Sample ranges whose frame energy is within top_db of the loudest frame.
/// Digital silence (no frame above -100 dB) yields no ranges.
std::vector<RawActiveRange> split_nonsilent(const Waveform& wav,
                                            const EnergyVadConfig& config = {});

/// Mean and spread of frame RMS power in dB (floor 1e-10, clipped at max - 80 dB).
EnergyStats energy_stats_from_rms(const std::vector<float>& rms);

/// energy_stats_from_rms() over frame_rms(samples, frame_length, hop_length).
EnergyStats energy_stats(const std::vector<float>& samples,
                         int frame_length = 2048, int hop_length = 512);

} // namespace sonix

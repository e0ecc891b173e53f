// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "audio_file.h"

#include <vector>

namespace sonix {

struct PitchConfig {
    double fmin = 65.406;       // C2
    double fmax = 2093.005;     // C7
    int frame_length = 2048;    // at the analysis rate, half of it is the comparison window
    int hop_length = 512;
    double threshold = 0.1;     // normalized difference a voiced frame must dip below
};

struct PitchStats {
    double mean_hz = 0.0;         // 0 when no frame is voiced
    double variability_hz = 0.0;  // population standard deviation, 0 below two voiced frames
    int voiced_frames = 0;
};

/// Fundamental frequency per frame in Hz, 0 for unvoiced frames.
/// Input above 16 kHz is box-averaged down by an integer factor first.
/// Throws SonixError for an inconsistent config.
std::vector<double> track_pitch(const Waveform& wav, const PitchConfig& config = {});

/// Mean and spread of the voiced frames from track_pitch().
PitchStats pitch_stats(const Waveform& wav, const PitchConfig& config = {});

} // namespace sonix

// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "audio_file.h"
#include "diarize.h"
#include "energy_vad.h"
#include "pitch.h"
#include "transcribe.h"
#include "vad.h"

#include <optional>
#include <string>
#include <vector>

namespace sonix {

struct AnalysisOptions {
    VadParams vad;
    bool diarize = true;
    std::string credential;  // empty = speech/silence segments only
    std::string language;    // whisper language, empty = auto-detect
    int threads = 0;
};

/// Caller-owned model handles. Every member is optional.
struct AnalysisBackends {
    VadBackend* vad = nullptr;
    DiarizationLoader diarization;
    WhisperModel* whisper = nullptr;
};

struct AudioAnalysis {
    AudioInfo audio_info;
    std::vector<Segment> segments;
    int speech_segments = 0;          // raw energy-detector speech ranges
    PitchStats pitch;
    EnergyStats energy;
    std::optional<int> speech_rate_wpm;
};

/// Segment a waveform: diarization tier (when enabled and credentialed), then
/// neural VAD, then energy VAD.
std::vector<Segment> segment_waveform(const Waveform& wav, const AnalysisOptions& options,
                                      const AnalysisBackends& backends = {});

/// Full report for a decoded waveform. info is reported as given.
AudioAnalysis analyze_waveform(const Waveform& wav, const AudioInfo& info,
                               const AnalysisOptions& options,
                               const AnalysisBackends& backends = {});

/// Decode a file and analyze it. Throws AudioInputError when it cannot be read.
AudioAnalysis analyze_audio(const fs::path& path, const AnalysisOptions& options,
                            const AnalysisBackends& backends = {});

} // namespace sonix

// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "util.h"

#include <cstdint>
#include <string>
#include <vector>

namespace sonix {

/// Decoded mono audio. Samples are float32 in [-1, 1].
struct Waveform {
    std::vector<float> samples;
    int sample_rate = 0;

    int64_t size() const { return static_cast<int64_t>(samples.size()); }
    double duration() const {
        return sample_rate > 0 ? static_cast<double>(samples.size()) / sample_rate : 0.0;
    }
};

struct AudioInfo {
    double duration_sec = 0.0;
    int sample_rate = 0;
    int channels = 0;
    int64_t frames = 0;
    std::string codec;  // "WAV/PCM_16", "FLAC/PCM_24", ...
};

/// Throw AudioInputError unless the waveform has samples and a positive rate.
void validate_waveform(const Waveform& wav);

/// Read any libsndfile-supported file as float32, downmixing to mono.
/// Throws AudioInputError when the file is missing, unreadable or empty.
Waveform read_audio(const fs::path& path);

/// Header metadata without decoding samples. Throws AudioInputError.
AudioInfo get_audio_info(const fs::path& path);

/// Write mono float samples as 16-bit PCM WAV using libsndfile.
void write_wav(const fs::path& path, const std::vector<float>& samples, int sample_rate);

/// "<FORMAT>/<SUBTYPE>" for a libsndfile format code, "unknown" for unmapped parts.
std::string codec_name(int sf_format);

} // namespace sonix

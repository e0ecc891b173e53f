// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "util.h"
#include "vad.h"

#include <string>

namespace sonix {

/// Environment variable holding the diarization credential.
constexpr const char* TOKEN_ENV_VAR = "HF_TOKEN";

struct Config {
    // VAD
    float top_db = 40.0f;
    double min_silence_gap_sec = 1.0;
    double pad_sec = 0.0;
    bool neural_vad = false;        // use Silero VAD when built with SONIX_USE_SHERPA
    float neural_threshold = 0.5f;

    // Diarization (needs a credential)
    bool diarize = true;
    std::string hf_token;
    int num_speakers = 0;             // 0 = auto-detect
    float cluster_threshold = 1.18f;  // clustering distance threshold (lower = more splitting)

    // Transcription
    std::string whisper_model;  // name or path, empty = no speech rate
    std::string language;       // empty = auto-detect, otherwise ISO 639-1 code

    // Performance
    int threads = 0;  // 0 = auto-detect (hardware_concurrency - 1)

    // Logging
    std::string log_level_str;  // "none", "error", "warn", "info" (default: "none")
    fs::path log_dir;           // empty = default (~/.local/share/sonix/logs/)

    VadParams vad_params() const;
};

/// Load config. Uses path if provided, otherwise ~/.config/sonix/config.yaml.
/// The token falls back to $HF_TOKEN when the file does not set one.
Config load_config(const fs::path& config_path = {});

/// Save config. Uses path if provided, otherwise ~/.config/sonix/config.yaml.
/// The token is never written.
void save_config(const Config& cfg, const fs::path& config_path = {});

} // namespace sonix

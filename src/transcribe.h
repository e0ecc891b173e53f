// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "audio_file.h"

#include <string>
#include <vector>

struct whisper_context;  // forward-declare to avoid exposing whisper.h

namespace sonix {

// ---------------------------------------------------------------------------
// WhisperModel: RAII wrapper for a loaded whisper.cpp model
// ---------------------------------------------------------------------------

class WhisperModel {
public:
    /// Load a GGUF model from disk.  Throws SonixError on failure.
    explicit WhisperModel(const fs::path& model_path);
    ~WhisperModel();

    WhisperModel(const WhisperModel&) = delete;
    WhisperModel& operator=(const WhisperModel&) = delete;

    WhisperModel(WhisperModel&& other) noexcept;
    WhisperModel& operator=(WhisperModel&& other) noexcept;

    whisper_context* get() const { return ctx_; }
    const fs::path& path() const { return path_; }

private:
    whisper_context* ctx_ = nullptr;
    fs::path path_;
};

// ---------------------------------------------------------------------------
// Transcript types
// ---------------------------------------------------------------------------

struct TranscriptSegment {
    double start;  // seconds
    double end;
    std::string text;
};

struct TranscriptResult {
    std::vector<TranscriptSegment> segments;
    std::string language;

    /// Whitespace-separated words across all segments.
    int word_count() const;

    /// Format as timestamped text: "[MM:SS - MM:SS] text"
    std::string to_string() const;
};

/// Words per minute over the given duration, rounded. 0 for a non-positive duration.
int speech_rate_wpm(int words, double duration_sec);

// ---------------------------------------------------------------------------
// Transcription
// ---------------------------------------------------------------------------

/// Transcribe a 16 kHz waveform with a pre-loaded model.
/// Throws SonixError on a wrong sample rate, unknown language or inference failure.
TranscriptResult transcribe(WhisperModel& model, const Waveform& wav,
                            const std::string& language = "", int threads = 0);

} // namespace sonix

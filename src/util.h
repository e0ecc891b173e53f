// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace sonix {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Exceptions
// ---------------------------------------------------------------------------

class SonixError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

/// Audio that cannot be decoded or segmented (missing file, empty waveform).
class AudioInputError : public SonixError {
    using SonixError::SonixError;
};

/// Neural backend failure: load error, inference error, timeout, malformed output.
class BackendError : public SonixError {
    using SonixError::SonixError;
};

/// Interval sequence violates its ordering contract.
class IntervalError : public SonixError {
    using SonixError::SonixError;
};

// ---------------------------------------------------------------------------
// Audio constants
// ---------------------------------------------------------------------------

/// Rate expected by the whisper.cpp and sherpa-onnx models.
constexpr int MODEL_SAMPLE_RATE = 16000;

// ---------------------------------------------------------------------------
// Path helpers (XDG-compliant)
// ---------------------------------------------------------------------------

/// ~/.config/sonix/
fs::path config_dir();

/// ~/.local/share/sonix/
fs::path data_dir();

/// ~/.local/share/sonix/models/
fs::path models_dir();

// ---------------------------------------------------------------------------
// File writing helper
// ---------------------------------------------------------------------------

/// Write text content to a file, throwing SonixError on failure.
void write_text_file(const fs::path& path, const std::string& content);

// ---------------------------------------------------------------------------
// Thread count helper
// ---------------------------------------------------------------------------

/// Default thread count for inference engines: hardware_concurrency() - 1, minimum 1.
int default_thread_count();

} // namespace sonix

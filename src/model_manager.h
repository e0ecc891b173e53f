// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "util.h"

#include <string>

namespace sonix {

/// Write downloaded bytes to dest.part, then rename it over dest so an
/// interrupted transfer never looks cached. The partial file is removed
/// before any error is rethrown.
void store_download(const fs::path& dest, const std::string& data);

/// Check whether a whisper model is already cached locally.
/// Throws SonixError for an unknown model name.
bool is_whisper_model_cached(const std::string& model_name);

/// Ensure a whisper model is available locally, downloading if needed.
/// Returns the path to the GGUF model file.
/// Model names: tiny, base, small, medium, large-v3
fs::path ensure_whisper_model(const std::string& model_name);

/// An existing file path is returned as is; anything else is treated as a
/// model name for ensure_whisper_model().
fs::path resolve_whisper_model(const std::string& name_or_path);

#if SONIX_USE_SHERPA
struct SherpaModelPaths {
    fs::path segmentation;  // pyannote segmentation model.onnx
    fs::path embedding;     // speaker embedding .onnx
};

/// Check whether the Silero VAD model is cached locally.
bool is_vad_model_cached();

/// Ensure the Silero VAD model is available, downloading if needed.
fs::path ensure_vad_model();

/// Check whether sherpa diarization models are cached locally.
bool is_sherpa_model_cached();

/// Ensure sherpa diarization models are available, downloading if needed.
/// token: Hugging Face access token sent as bearer auth (may be empty).
SherpaModelPaths ensure_sherpa_models(const std::string& token = "");
#endif

} // namespace sonix

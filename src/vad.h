// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "audio_file.h"
#include "energy_vad.h"
#include "segment.h"

#include <functional>
#include <string>
#include <vector>

namespace sonix {

// ---------------------------------------------------------------------------
// Neural VAD backend
// ---------------------------------------------------------------------------

struct TimeWindow {
    double start;  // seconds
    double end;
};

struct ProbabilityWindow {
    double start_time_sec;
    double end_time_sec;
    float speech_probability;
};

/// Sliding-window inference output: windows and probabilities are reported as
/// two parallel lists and validated by to_probability_windows().
struct VadInference {
    std::vector<TimeWindow> windows;
    std::vector<float> probabilities;
};

/// A loaded neural VAD model. Owned by the caller and handed to VadEngine.
class VadBackend {
public:
    virtual ~VadBackend() = default;

    /// Run inference. May throw; VadEngine treats any exception as a failure.
    virtual VadInference infer(const Waveform& wav) = 0;
    virtual std::string name() const = 0;
};

/// Pair windows with probabilities. Throws BackendError on malformed output:
/// missing lists, count mismatch, inverted windows, probabilities outside [0, 1].
std::vector<ProbabilityWindow> to_probability_windows(const VadInference& inference);

/// Windows with probability >= threshold as sorted sample ranges, clamped to
/// [0, total]; overlapping or touching windows are joined.
std::vector<RawActiveRange> windows_to_ranges(const std::vector<ProbabilityWindow>& windows,
                                              float threshold, int sample_rate, int64_t total);

// ---------------------------------------------------------------------------
// Fallback chain
// ---------------------------------------------------------------------------

struct TierResult {
    bool ok = false;
    std::vector<Segment> segments;
    std::string failure;

    static TierResult success(std::vector<Segment> segments);
    static TierResult failed(std::string reason);
};

struct SegmentationTier {
    std::string name;
    std::function<TierResult(const Waveform&)> run;
};

/// Run tiers in order and return the first successful, non-empty result.
/// Failures are logged at WARN. Throws SonixError if every tier fails.
std::vector<Segment> run_tiers(const std::vector<SegmentationTier>& tiers, const Waveform& wav);

// ---------------------------------------------------------------------------
// VadEngine
// ---------------------------------------------------------------------------

struct VadParams {
    float top_db = 40.0f;
    double min_silence_gap_sec = 1.0;
    double pad_sec = 0.0;
    float neural_threshold = 0.5f;
};

class VadEngine {
public:
    /// backend may be null, in which case only the energy detector runs.
    explicit VadEngine(VadParams params = {}, VadBackend* backend = nullptr);

    /// Speech/silence segments for the waveform. Throws AudioInputError for an
    /// empty waveform or invalid rate; neural failures fall back to energy VAD.
    std::vector<Segment> run(const Waveform& wav) const;

    TierResult neural_tier(const Waveform& wav) const;
    TierResult energy_tier(const Waveform& wav) const;

    /// This engine as a single tier for an outer chain.
    SegmentationTier as_tier() const;

    const VadParams& params() const { return params_; }
    bool has_backend() const { return backend_ != nullptr; }

private:
    std::vector<Segment> to_segments(const std::vector<RawActiveRange>& ranges,
                                     const Waveform& wav) const;

    VadParams params_;
    VadBackend* backend_;
};

// ---------------------------------------------------------------------------
// sherpa-onnx Silero VAD
// ---------------------------------------------------------------------------

#if SONIX_USE_SHERPA
struct SileroVadConfig {
    float threshold = 0.5f;
    float min_silence_duration = 0.5f;
    float min_speech_duration = 0.25f;
    float max_speech_duration = 30.0f;
    int window_size = 512;
};

/// Silero VAD via sherpa-onnx. Speech segments are reported as probability 1
/// windows and the gaps between them as probability 0 windows.
class SherpaVadBackend : public VadBackend {
public:
    /// Throws BackendError if the model file is missing.
    /// threads: number of CPU threads (0 = use default_thread_count()).
    explicit SherpaVadBackend(const fs::path& model_path,
                              const SileroVadConfig& config = {}, int threads = 0);

    VadInference infer(const Waveform& wav) override;
    std::string name() const override { return "silero-vad"; }

private:
    fs::path model_path_;
    SileroVadConfig config_;
    int threads_;
};
#endif

} // namespace sonix

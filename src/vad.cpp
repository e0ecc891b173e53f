// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "vad.h"
#include "log.h"

#include <algorithm>
#include <cmath>

#if SONIX_USE_SHERPA
#include <sherpa-onnx/c-api/c-api.h>
#endif

namespace sonix {

// ---------------------------------------------------------------------------
// Neural output conversion
// ---------------------------------------------------------------------------

std::vector<ProbabilityWindow> to_probability_windows(const VadInference& inference) {
    if (inference.windows.empty())
        throw BackendError("VAD inference returned no windows");
    if (inference.probabilities.empty())
        throw BackendError("VAD inference returned no speech probabilities");
    if (inference.windows.size() != inference.probabilities.size())
        throw BackendError("VAD inference returned " + std::to_string(inference.windows.size()) +
                           " windows but " + std::to_string(inference.probabilities.size()) +
                           " probabilities");

    std::vector<ProbabilityWindow> out;
    out.reserve(inference.windows.size());
    for (size_t i = 0; i < inference.windows.size(); ++i) {
        const auto& w = inference.windows[i];
        float p = inference.probabilities[i];
        if (!std::isfinite(w.start) || !std::isfinite(w.end) || w.end <= w.start)
            throw BackendError("VAD window " + std::to_string(i) + " is empty or inverted");
        if (!std::isfinite(p) || p < 0.0f || p > 1.0f)
            throw BackendError("VAD window " + std::to_string(i) +
                               " has probability outside [0, 1]");
        out.push_back({w.start, w.end, p});
    }
    return out;
}

std::vector<RawActiveRange> windows_to_ranges(const std::vector<ProbabilityWindow>& windows,
                                              float threshold, int sample_rate, int64_t total) {
    auto sorted = windows;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const ProbabilityWindow& a, const ProbabilityWindow& b) {
                         return a.start_time_sec < b.start_time_sec;
                     });

    std::vector<RawActiveRange> ranges;
    for (const auto& w : sorted) {
        if (w.speech_probability < threshold) continue;

        int64_t s = std::clamp<int64_t>(std::llround(w.start_time_sec * sample_rate), 0, total);
        int64_t e = std::clamp<int64_t>(std::llround(w.end_time_sec * sample_rate), 0, total);
        if (e <= s) continue;

        if (!ranges.empty() && s <= ranges.back().end_sample)
            ranges.back().end_sample = std::max(ranges.back().end_sample, e);
        else
            ranges.push_back({s, e});
    }
    return ranges;
}

// ---------------------------------------------------------------------------
// Fallback chain
// ---------------------------------------------------------------------------

TierResult TierResult::success(std::vector<Segment> segments) {
    TierResult r;
    r.ok = true;
    r.segments = std::move(segments);
    return r;
}

TierResult TierResult::failed(std::string reason) {
    TierResult r;
    r.failure = std::move(reason);
    return r;
}

std::vector<Segment> run_tiers(const std::vector<SegmentationTier>& tiers, const Waveform& wav) {
    for (const auto& tier : tiers) {
        TierResult result = tier.run(wav);
        if (result.ok && !result.segments.empty()) {
            log_info("Segmentation: %s produced %zu segment(s)",
                     tier.name.c_str(), result.segments.size());
            return std::move(result.segments);
        }
        log_warn("Segmentation: %s failed (%s), trying next tier", tier.name.c_str(),
                 result.ok ? "no segments" : result.failure.c_str());
    }
    throw SonixError("All segmentation tiers failed");
}

// ---------------------------------------------------------------------------
// VadEngine
// ---------------------------------------------------------------------------

VadEngine::VadEngine(VadParams params, VadBackend* backend)
    : params_(params), backend_(backend) {}

std::vector<Segment> VadEngine::to_segments(const std::vector<RawActiveRange>& ranges,
                                            const Waveform& wav) const {
    auto merge = MergeConfig::from_seconds(params_.min_silence_gap_sec, params_.pad_sec,
                                           wav.sample_rate);
    auto intervals = build_intervals(ranges, wav.size());
    auto merged = merge_intervals(intervals, merge.min_silence_gap_samples);
    return format_segments(merged, wav.sample_rate, wav.size(), merge.pad_samples);
}

TierResult VadEngine::neural_tier(const Waveform& wav) const {
    if (!backend_)
        return TierResult::failed("no neural backend configured");

    std::vector<RawActiveRange> ranges;
    try {
        auto windows = to_probability_windows(backend_->infer(wav));
        ranges = windows_to_ranges(windows, params_.neural_threshold,
                                   wav.sample_rate, wav.size());
    } catch (const std::exception& e) {
        return TierResult::failed(backend_->name() + ": " + e.what());
    } catch (...) {
        return TierResult::failed(backend_->name() + ": unknown error");
    }
    return TierResult::success(to_segments(ranges, wav));
}

TierResult VadEngine::energy_tier(const Waveform& wav) const {
    EnergyVadConfig cfg;
    cfg.top_db = params_.top_db;
    return TierResult::success(to_segments(split_nonsilent(wav, cfg), wav));
}

SegmentationTier VadEngine::as_tier() const {
    return {"vad", [this](const Waveform& wav) { return TierResult::success(run(wav)); }};
}

std::vector<Segment> VadEngine::run(const Waveform& wav) const {
    validate_waveform(wav);

    std::vector<SegmentationTier> tiers;
    if (backend_)
        tiers.push_back({"neural vad", [this](const Waveform& w) { return neural_tier(w); }});
    tiers.push_back({"energy vad", [this](const Waveform& w) { return energy_tier(w); }});

    return run_tiers(tiers, wav);
}

// ---------------------------------------------------------------------------
// sherpa-onnx Silero VAD
// ---------------------------------------------------------------------------

#if SONIX_USE_SHERPA
SherpaVadBackend::SherpaVadBackend(const fs::path& model_path,
                                   const SileroVadConfig& config, int threads)
    : model_path_(model_path), config_(config),
      threads_(threads > 0 ? threads : default_thread_count()) {
    if (!fs::exists(model_path_) || fs::file_size(model_path_) == 0)
        throw BackendError("Silero VAD model not found: " + model_path_.string());
}

VadInference SherpaVadBackend::infer(const Waveform& wav) {
    if (wav.sample_rate != MODEL_SAMPLE_RATE)
        throw BackendError("Silero VAD requires " + std::to_string(MODEL_SAMPLE_RATE) +
                           "Hz audio, got " + std::to_string(wav.sample_rate) + "Hz");

    SherpaOnnxSileroVadModelConfig silero{};
    silero.model = model_path_.c_str();
    silero.threshold = config_.threshold;
    silero.min_silence_duration = config_.min_silence_duration;
    silero.min_speech_duration = config_.min_speech_duration;
    silero.max_speech_duration = config_.max_speech_duration;
    silero.window_size = config_.window_size;

    SherpaOnnxVadModelConfig vad_cfg{};
    vad_cfg.silero_vad = silero;
    vad_cfg.sample_rate = wav.sample_rate;
    vad_cfg.num_threads = threads_;
    vad_cfg.provider = "cpu";
    vad_cfg.debug = 0;

    const auto* vad = SherpaOnnxCreateVoiceActivityDetector(&vad_cfg, 30.0f);
    if (!vad)
        throw BackendError("Failed to create sherpa-onnx VAD");

    // Feed audio in window_size chunks
    int32_t total = static_cast<int32_t>(wav.samples.size());
    int32_t ws = config_.window_size;
    for (int32_t offset = 0; offset + ws <= total; offset += ws)
        SherpaOnnxVoiceActivityDetectorAcceptWaveform(vad, wav.samples.data() + offset, ws);
    SherpaOnnxVoiceActivityDetectorFlush(vad);

    const double sr = static_cast<double>(wav.sample_rate);
    VadInference out;
    double cursor = 0.0;

    while (!SherpaOnnxVoiceActivityDetectorEmpty(vad)) {
        const auto* seg = SherpaOnnxVoiceActivityDetectorFront(vad);
        if (seg) {
            double start = seg->start / sr;
            double end = (seg->start + seg->n) / sr;
            if (start > cursor) {
                out.windows.push_back({cursor, start});
                out.probabilities.push_back(0.0f);
            }
            out.windows.push_back({start, end});
            out.probabilities.push_back(1.0f);
            cursor = end;
            SherpaOnnxDestroySpeechSegment(seg);
        }
        SherpaOnnxVoiceActivityDetectorPop(vad);
    }
    SherpaOnnxDestroyVoiceActivityDetector(vad);

    if (wav.duration() > cursor) {
        out.windows.push_back({cursor, wav.duration()});
        out.probabilities.push_back(0.0f);
    }

    log_info("Silero VAD: %zu window(s) over %.1fs", out.windows.size(), wav.duration());
    return out;
}
#endif

} // namespace sonix

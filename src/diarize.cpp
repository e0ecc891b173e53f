// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "diarize.h"
#include "log.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

#if SONIX_USE_SHERPA
#include <sherpa-onnx/c-api/c-api.h>
#endif

namespace sonix {

std::string format_speaker(int speaker_id) {
    char buf[16];
    snprintf(buf, sizeof(buf), "Speaker_%02d", speaker_id + 1);
    return buf;
}

std::vector<Segment> turns_to_segments(const std::vector<SpeakerTurn>& turns) {
    if (turns.empty())
        throw BackendError("Diarization returned no speaker turns");

    std::vector<Segment> segments;
    segments.reserve(turns.size());
    for (const auto& t : turns) {
        if (!std::isfinite(t.start) || !std::isfinite(t.end) || t.end <= t.start || t.start < 0)
            throw BackendError("Diarization returned an invalid turn");
        if (t.speaker < 0)
            throw BackendError("Diarization returned a negative speaker id");
        segments.push_back({t.start, t.end, format_speaker(t.speaker), ""});
    }

    std::stable_sort(segments.begin(), segments.end(),
                     [](const Segment& a, const Segment& b) {
                         return a.start_time_sec < b.start_time_sec;
                     });
    return segments;
}

std::vector<Segment> attach_transcripts(const std::vector<Segment>& segments,
                                        const std::vector<TranscriptSegment>& transcript) {
    std::vector<Segment> result = segments;

    for (const auto& ts : transcript) {
        // Find the segment with maximum temporal overlap
        Segment* best = nullptr;
        double best_overlap = 0.0;

        for (auto& seg : result) {
            if (seg.is_silence()) continue;
            double overlap = std::min(ts.end, seg.end_time_sec) -
                             std::max(ts.start, seg.start_time_sec);
            if (overlap > best_overlap) {
                best_overlap = overlap;
                best = &seg;
            }
        }

        if (!best) continue;
        if (!best->transcript.empty())
            best->transcript += ' ';
        best->transcript += ts.text;
    }

    return result;
}

// ---------------------------------------------------------------------------
// Diarizer
// ---------------------------------------------------------------------------

Diarizer::Diarizer(const VadEngine& vad, DiarizationLoader loader)
    : vad_(vad), loader_(std::move(loader)) {}

TierResult Diarizer::diarization_tier(const Waveform& wav, const std::string& credential) const {
    if (credential.empty())
        return TierResult::failed("no credential supplied");
    if (!loader_)
        return TierResult::failed("no diarization backend available");

    try {
        auto backend = loader_(credential);
        if (!backend)
            return TierResult::failed("diarization backend failed to load");
        auto segments = turns_to_segments(backend->diarize(wav));
        log_info("Diarization: %s returned %zu turn(s)",
                 backend->name().c_str(), segments.size());
        return TierResult::success(std::move(segments));
    } catch (const std::exception& e) {
        return TierResult::failed(e.what());
    } catch (...) {
        return TierResult::failed("diarization backend: unknown error");
    }
}

std::vector<Segment> Diarizer::run(const Waveform& wav, const std::string& credential) const {
    validate_waveform(wav);

    std::vector<SegmentationTier> tiers;
    tiers.push_back({"diarization", [this, &credential](const Waveform& w) {
        return diarization_tier(w, credential);
    }});
    tiers.push_back(vad_.as_tier());

    return run_tiers(tiers, wav);
}

// ---------------------------------------------------------------------------
// sherpa-onnx diarization
// ---------------------------------------------------------------------------

#if SONIX_USE_SHERPA
SherpaDiarizer::SherpaDiarizer(const SherpaModelPaths& models, const SherpaDiarizerConfig& config) {
    int t = config.threads > 0 ? config.threads : default_thread_count();

    // Configure segmentation model
    SherpaOnnxOfflineSpeakerSegmentationPyannoteModelConfig pyannote{};
    pyannote.model = models.segmentation.c_str();

    SherpaOnnxOfflineSpeakerSegmentationModelConfig seg_cfg{};
    seg_cfg.pyannote = pyannote;
    seg_cfg.num_threads = t;
    seg_cfg.debug = 0;
    seg_cfg.provider = "cpu";

    // Configure embedding extractor
    SherpaOnnxSpeakerEmbeddingExtractorConfig emb_cfg{};
    emb_cfg.model = models.embedding.c_str();
    emb_cfg.num_threads = t;
    emb_cfg.debug = 0;
    emb_cfg.provider = "cpu";

    // Configure clustering
    SherpaOnnxFastClusteringConfig cluster_cfg{};
    cluster_cfg.num_clusters = config.num_speakers > 0 ? config.num_speakers : -1;
    cluster_cfg.threshold = config.cluster_threshold;

    SherpaOnnxOfflineSpeakerDiarizationConfig sd_cfg{};
    sd_cfg.segmentation = seg_cfg;
    sd_cfg.embedding = emb_cfg;
    sd_cfg.clustering = cluster_cfg;
    sd_cfg.min_duration_on = 0.3f;
    sd_cfg.min_duration_off = 0.5f;

    sd_ = SherpaOnnxCreateOfflineSpeakerDiarization(&sd_cfg);
    if (!sd_)
        throw BackendError("Failed to create sherpa-onnx speaker diarization");
}

SherpaDiarizer::~SherpaDiarizer() {
    if (sd_)
        SherpaOnnxDestroyOfflineSpeakerDiarization(sd_);
}

std::vector<SpeakerTurn> SherpaDiarizer::diarize(const Waveform& wav) {
    int expected = SherpaOnnxOfflineSpeakerDiarizationGetSampleRate(sd_);
    if (wav.sample_rate != expected)
        throw BackendError("Diarization requires " + std::to_string(expected) +
                           "Hz audio, got " + std::to_string(wav.sample_rate) + "Hz");

    log_info("Diarizing %zu samples (%.1fs)", wav.samples.size(), wav.duration());

    const auto* raw_result = SherpaOnnxOfflineSpeakerDiarizationProcess(
        sd_, wav.samples.data(), static_cast<int32_t>(wav.samples.size()));
    if (!raw_result)
        throw BackendError("Speaker diarization processing failed");

    int32_t num_segments = SherpaOnnxOfflineSpeakerDiarizationResultGetNumSegments(raw_result);

    std::vector<SpeakerTurn> turns;
    const auto* sorted = SherpaOnnxOfflineSpeakerDiarizationResultSortByStartTime(raw_result);
    if (sorted) {
        turns.reserve(num_segments);
        for (int32_t i = 0; i < num_segments; ++i) {
            turns.push_back({
                static_cast<double>(sorted[i].start),
                static_cast<double>(sorted[i].end),
                sorted[i].speaker
            });
        }
        SherpaOnnxOfflineSpeakerDiarizationDestroySegment(sorted);
    }

    log_info("Diarization complete: %d speakers, %zu turns",
             SherpaOnnxOfflineSpeakerDiarizationResultGetNumSpeakers(raw_result), turns.size());
    SherpaOnnxOfflineSpeakerDiarizationDestroyResult(raw_result);

    return turns;
}

DiarizationLoader sherpa_diarization_loader(const SherpaDiarizerConfig& config) {
    return [config](const std::string& credential) -> std::unique_ptr<DiarizationBackend> {
        auto models = ensure_sherpa_models(credential);
        return std::make_unique<SherpaDiarizer>(models, config);
    };
}
#endif

} // namespace sonix

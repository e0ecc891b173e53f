// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "transcribe.h"
#include "vad.h"

#include <functional>
#include <memory>
#include <string>
#include <vector>

#if SONIX_USE_SHERPA
#include "model_manager.h"
struct SherpaOnnxOfflineSpeakerDiarization;  // forward-declare to avoid exposing c-api.h
#endif

namespace sonix {

struct SpeakerTurn {
    double start;  // seconds
    double end;
    int speaker;   // 0-based
};

/// A loaded speaker diarization model.
class DiarizationBackend {
public:
    virtual ~DiarizationBackend() = default;

    /// Speaker-labeled turns. May throw; Diarizer treats any exception as a failure.
    virtual std::vector<SpeakerTurn> diarize(const Waveform& wav) = 0;
    virtual std::string name() const = 0;
};

/// Loads a backend with the given credential. Load failures are reported by throwing.
using DiarizationLoader =
    std::function<std::unique_ptr<DiarizationBackend>(const std::string& credential)>;

/// Format a 0-based speaker ID as "Speaker_01", "Speaker_02", etc.
std::string format_speaker(int speaker_id);

/// Speaker turns as segments sorted by start. Throws BackendError for an empty
/// list, inverted or non-finite turns, or negative speaker ids.
std::vector<Segment> turns_to_segments(const std::vector<SpeakerTurn>& turns);

/// Attach transcript text to segments by timestamp overlap.
/// Each transcript segment goes to the non-silence segment with maximum
/// temporal overlap; several texts on one segment are joined with a space.
std::vector<Segment> attach_transcripts(const std::vector<Segment>& segments,
                                        const std::vector<TranscriptSegment>& transcript);

/// Speaker diarization with the VAD as fallback tier.
class Diarizer {
public:
    /// vad must outlive the Diarizer. loader may be empty (diarization unavailable).
    explicit Diarizer(const VadEngine& vad, DiarizationLoader loader = nullptr);

    /// Speaker segments when a credential is given and the backend succeeds,
    /// otherwise the VAD's speech/silence segments for the same waveform.
    std::vector<Segment> run(const Waveform& wav, const std::string& credential = "") const;

    TierResult diarization_tier(const Waveform& wav, const std::string& credential) const;

private:
    const VadEngine& vad_;
    DiarizationLoader loader_;
};

#if SONIX_USE_SHERPA
struct SherpaDiarizerConfig {
    int num_speakers = 0;            // 0 = auto-detect
    float cluster_threshold = 1.18f; // lower = more speakers
    int threads = 0;                 // 0 = default_thread_count()
};

/// pyannote segmentation + speaker embedding clustering via sherpa-onnx.
class SherpaDiarizer : public DiarizationBackend {
public:
    /// Throws BackendError if the models cannot be loaded.
    SherpaDiarizer(const SherpaModelPaths& models, const SherpaDiarizerConfig& config = {});
    ~SherpaDiarizer() override;

    SherpaDiarizer(const SherpaDiarizer&) = delete;
    SherpaDiarizer& operator=(const SherpaDiarizer&) = delete;

    std::vector<SpeakerTurn> diarize(const Waveform& wav) override;
    std::string name() const override { return "sherpa-diarization"; }

private:
    const SherpaOnnxOfflineSpeakerDiarization* sd_ = nullptr;
};

/// Loader that fetches the diarization models (using the credential as bearer
/// token) and constructs a SherpaDiarizer.
DiarizationLoader sherpa_diarization_loader(const SherpaDiarizerConfig& config);
#endif

} // namespace sonix

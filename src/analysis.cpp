// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "analysis.h"
#include "log.h"

namespace sonix {

std::vector<Segment> segment_waveform(const Waveform& wav, const AnalysisOptions& options,
                                      const AnalysisBackends& backends) {
    VadEngine vad(options.vad, backends.vad);
    if (!options.diarize)
        return vad.run(wav);

    Diarizer diarizer(vad, backends.diarization);
    return diarizer.run(wav, options.credential);
}

AudioAnalysis analyze_waveform(const Waveform& wav, const AudioInfo& info,
                               const AnalysisOptions& options,
                               const AnalysisBackends& backends) {
    validate_waveform(wav);

    AudioAnalysis analysis;
    analysis.audio_info = info;
    analysis.segments = segment_waveform(wav, options, backends);

    EnergyVadConfig energy_cfg;
    energy_cfg.top_db = options.vad.top_db;
    auto rms = frame_rms(wav.samples, energy_cfg.frame_length, energy_cfg.hop_length);
    analysis.speech_segments =
        static_cast<int>(active_ranges_from_rms(rms, wav.size(), energy_cfg).size());
    analysis.energy = energy_stats_from_rms(rms);
    analysis.pitch = pitch_stats(wav);

    if (backends.whisper) {
        try {
            auto transcript = transcribe(*backends.whisper, wav, options.language, options.threads);
            analysis.speech_rate_wpm = speech_rate_wpm(transcript.word_count(), wav.duration());
            analysis.segments = attach_transcripts(analysis.segments, transcript.segments);
        } catch (const SonixError& e) {
            log_warn("Speech rate unavailable: %s", e.what());
        }
    }

    log_info("Analysis: %zu segment(s), %d speech range(s), mean pitch %.2f Hz, mean energy %.2f dB",
             analysis.segments.size(), analysis.speech_segments, analysis.pitch.mean_hz,
             analysis.energy.mean_db);
    return analysis;
}

AudioAnalysis analyze_audio(const fs::path& path, const AnalysisOptions& options,
                            const AnalysisBackends& backends) {
    AudioInfo info = get_audio_info(path);
    Waveform wav = read_audio(path);
    return analyze_waveform(wav, info, options, backends);
}

} // namespace sonix

// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "transcribe.h"
#include "log.h"

#include <whisper.h>

#include <cmath>
#include <cstdio>
#include <sstream>

namespace sonix {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static std::string format_clock(double seconds) {
    int total = static_cast<int>(seconds);
    char buf[16];
    snprintf(buf, sizeof(buf), "%02d:%02d", total / 60, total % 60);
    return buf;
}

static std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

int TranscriptResult::word_count() const {
    int words = 0;
    for (const auto& seg : segments) {
        std::istringstream iss(seg.text);
        std::string word;
        while (iss >> word)
            ++words;
    }
    return words;
}

std::string TranscriptResult::to_string() const {
    std::ostringstream oss;
    for (const auto& seg : segments) {
        oss << "[" << format_clock(seg.start) << " - "
            << format_clock(seg.end) << "] " << seg.text << "\n";
    }
    return oss.str();
}

int speech_rate_wpm(int words, double duration_sec) {
    if (duration_sec <= 0.0) return 0;
    return static_cast<int>(std::lround(words / (duration_sec / 60.0)));
}

// ---------------------------------------------------------------------------
// WhisperModel
// ---------------------------------------------------------------------------

WhisperModel::WhisperModel(const fs::path& model_path) : path_(model_path) {
    log_info("Loading whisper model: %s", path_.filename().c_str());
    whisper_context_params cparams = whisper_context_default_params();
    ctx_ = whisper_init_from_file_with_params(path_.c_str(), cparams);
    if (!ctx_)
        throw SonixError("Failed to load whisper model: " + path_.string());
}

WhisperModel::~WhisperModel() {
    if (ctx_)
        whisper_free(ctx_);
}

WhisperModel::WhisperModel(WhisperModel&& other) noexcept
    : ctx_(other.ctx_), path_(std::move(other.path_)) {
    other.ctx_ = nullptr;
}

WhisperModel& WhisperModel::operator=(WhisperModel&& other) noexcept {
    if (this != &other) {
        if (ctx_)
            whisper_free(ctx_);
        ctx_ = other.ctx_;
        path_ = std::move(other.path_);
        other.ctx_ = nullptr;
    }
    return *this;
}

// ---------------------------------------------------------------------------
// Transcription
// ---------------------------------------------------------------------------

TranscriptResult transcribe(WhisperModel& model, const Waveform& wav,
                            const std::string& language, int threads) {
    if (wav.sample_rate != MODEL_SAMPLE_RATE)
        throw SonixError("Whisper requires " + std::to_string(MODEL_SAMPLE_RATE) +
                         "Hz audio, got " + std::to_string(wav.sample_rate) + "Hz");

    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    wparams.n_threads = threads > 0 ? threads : default_thread_count();
    wparams.print_progress = false;
    wparams.print_timestamps = false;

    if (!language.empty()) {
        if (whisper_lang_id(language.c_str()) < 0)
            throw SonixError("Unknown language code: " + language);
        wparams.language = language.c_str();
        wparams.detect_language = false;
    } else {
        wparams.language = nullptr;
        wparams.detect_language = false;
    }

    whisper_context* ctx = model.get();
    log_info("Transcribing %.1fs of audio...", wav.duration());
    int ret = whisper_full(ctx, wparams, wav.samples.data(), static_cast<int>(wav.samples.size()));
    if (ret != 0)
        throw SonixError("Whisper transcription failed (code " + std::to_string(ret) + ")");

    TranscriptResult result;
    int n_segments = whisper_full_n_segments(ctx);
    for (int i = 0; i < n_segments; ++i) {
        TranscriptSegment seg;
        seg.start = whisper_full_get_segment_t0(ctx, i) / 100.0;
        seg.end   = whisper_full_get_segment_t1(ctx, i) / 100.0;
        seg.text  = trim(whisper_full_get_segment_text(ctx, i));
        if (!seg.text.empty())
            result.segments.push_back(std::move(seg));
    }
    result.language = whisper_lang_str(whisper_full_lang_id(ctx));

    log_info("Transcribed %zu segments, %d words (language: %s)",
             result.segments.size(), result.word_count(), result.language.c_str());
    return result;
}

} // namespace sonix

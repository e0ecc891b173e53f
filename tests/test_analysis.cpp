// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "analysis.h"
#include "report.h"

#include <cmath>
#include <memory>

using namespace sonix;
using Catch::Matchers::WithinAbs;

namespace {

fs::path tmp_dir() {
    fs::path dir = fs::temp_directory_path() / "sonix_test_analysis";
    fs::create_directories(dir);
    return dir;
}

// 1.5s silence, 2s tone, 2s silence, 1s tone, 1.5s silence
std::vector<float> two_phrases(int sample_rate) {
    std::vector<float> out;
    auto silence = [&](double sec) {
        out.insert(out.end(), static_cast<size_t>(sec * sample_rate), 0.0f);
    };
    auto tone = [&](double sec) {
        size_t n = static_cast<size_t>(sec * sample_rate);
        for (size_t i = 0; i < n; ++i)
            out.push_back(0.5f * static_cast<float>(std::sin(2.0 * M_PI * 440.0 * i / sample_rate)));
    };
    silence(1.5);
    tone(2.0);
    silence(2.0);
    tone(1.0);
    silence(1.5);
    return out;
}

class FakeDiarization : public DiarizationBackend {
public:
    std::vector<SpeakerTurn> diarize(const Waveform&) override {
        return {{1.5, 3.5, 0}, {5.5, 6.5, 1}};
    }
    std::string name() const override { return "fake"; }
};

} // anonymous namespace

// ---------------------------------------------------------------------------
// analyze_audio
// ---------------------------------------------------------------------------

TEST_CASE("analyze_audio: speech/silence report for a file", "[analysis]") {
    fs::path wav = tmp_dir() / "two_phrases.wav";
    write_wav(wav, two_phrases(16000), 16000);

    AnalysisOptions opts;
    opts.diarize = false;
    auto a = analyze_audio(wav, opts);

    CHECK(a.audio_info.sample_rate == 16000);
    CHECK(a.audio_info.channels == 1);
    CHECK(a.audio_info.codec == "WAV/PCM_16");
    CHECK_THAT(a.audio_info.duration_sec, WithinAbs(8.0, 1e-6));

    REQUIRE(a.segments.size() == 5);
    CHECK(a.segments[1].label == "speech");
    CHECK(a.segments[3].label == "speech");
    CHECK(a.speech_segments == 2);
    CHECK(a.energy.mean_db < -9.0);
    CHECK(a.energy.variability_db > 10.0);
    CHECK_THAT(a.pitch.mean_hz, WithinAbs(440.0, 5.0));
    CHECK_FALSE(a.speech_rate_wpm.has_value());

    fs::remove(wav);
}

TEST_CASE("analyze_audio: unreadable file throws AudioInputError", "[analysis]") {
    CHECK_THROWS_AS(analyze_audio("/nonexistent/audio.wav", {}), AudioInputError);
}

TEST_CASE("analyze_waveform: non-16kHz audio is analyzed at its native rate", "[analysis]") {
    Waveform wav;
    wav.sample_rate = 44100;
    wav.samples = two_phrases(44100);
    AudioInfo info;
    info.sample_rate = 44100;

    AnalysisOptions opts;
    opts.diarize = false;
    auto a = analyze_waveform(wav, info, opts);
    REQUIRE(a.segments.size() == 5);
    CHECK_THAT(a.segments[3].start_time_sec, WithinAbs(5.5, 0.1));
    CHECK_THAT(a.segments.back().end_time_sec, WithinAbs(8.0, 1e-9));
}

TEST_CASE("analyze_waveform: pure 220 Hz tone reports its pitch", "[analysis]") {
    Waveform wav;
    wav.sample_rate = 16000;
    for (size_t i = 0; i < 32000; ++i)
        wav.samples.push_back(0.5f * static_cast<float>(std::sin(2.0 * M_PI * 220.0 * i / 16000)));
    AudioInfo info;
    info.sample_rate = 16000;

    AnalysisOptions opts;
    opts.diarize = false;
    auto a = analyze_waveform(wav, info, opts);
    CHECK_THAT(a.pitch.mean_hz, WithinAbs(220.0, 1.0));
    CHECK(a.pitch.variability_hz < 1.0);

    std::string json = analysis_to_json(a);
    CHECK(json.find("\"average_pitch_hz\": 2") != std::string::npos);
}

TEST_CASE("analyze_waveform: digital silence has zero pitch", "[analysis]") {
    Waveform wav;
    wav.sample_rate = 16000;
    wav.samples.assign(32000, 0.0f);

    AnalysisOptions opts;
    opts.diarize = false;
    auto a = analyze_waveform(wav, {}, opts);
    CHECK(a.pitch.mean_hz == 0.0);
    CHECK(a.pitch.variability_hz == 0.0);

    std::string json = analysis_to_json(a);
    CHECK(json.find("\"average_pitch_hz\": 0.00") != std::string::npos);
    CHECK(json.find("\"pitch_variance\": 0.00") != std::string::npos);
}

TEST_CASE("segment_waveform: diarization with credential, VAD without", "[analysis]") {
    Waveform wav;
    wav.sample_rate = 16000;
    wav.samples = two_phrases(16000);

    AnalysisOptions opts;
    AnalysisBackends backends;
    backends.diarization = [](const std::string&) {
        return std::unique_ptr<DiarizationBackend>(new FakeDiarization());
    };

    auto without = segment_waveform(wav, opts, backends);
    CHECK(without.size() == 5);
    CHECK(without[1].label == "speech");

    opts.credential = "hf_token";
    auto with = segment_waveform(wav, opts, backends);
    REQUIRE(with.size() == 2);
    CHECK(with[0].label == "Speaker_01");
    CHECK(with[1].label == "Speaker_02");

    opts.diarize = false;
    CHECK(segment_waveform(wav, opts, backends).size() == 5);
}

// ---------------------------------------------------------------------------
// JSON report
// ---------------------------------------------------------------------------

TEST_CASE("json_escape: quotes, backslashes and control characters", "[analysis]") {
    CHECK(json_escape("plain") == "plain");
    CHECK(json_escape("say \"hi\"") == "say \\\"hi\\\"");
    CHECK(json_escape("a\\b") == "a\\\\b");
    CHECK(json_escape("line\nbreak\ttab") == "line\\nbreak\\ttab");
    CHECK(json_escape(std::string("\x01", 1)) == "\\u0001");
}

TEST_CASE("segments_to_json: four decimal times", "[analysis]") {
    std::vector<Segment> segs = {
        {0.0, 1.23456, "silence", ""},
        {1.23456, 2.5, "speech", "hello \"world\""},
    };
    std::string json = segments_to_json(segs);
    CHECK(json.find("\"segments\": [") != std::string::npos);
    CHECK(json.find("\"start_time_sec\": 0.0000") != std::string::npos);
    CHECK(json.find("\"end_time_sec\": 1.2346") != std::string::npos);
    CHECK(json.find("\"label\": \"speech\"") != std::string::npos);
    CHECK(json.find("\"transcript\": \"hello \\\"world\\\"\"") != std::string::npos);
}

TEST_CASE("segments_to_json: empty list", "[analysis]") {
    CHECK(segments_to_json({}) == "{\n  \"segments\": []\n}\n");
}

TEST_CASE("analysis_to_json: features rounded to two decimals", "[analysis]") {
    AudioAnalysis a;
    a.audio_info.duration_sec = 12.3456;
    a.audio_info.sample_rate = 16000;
    a.audio_info.channels = 1;
    a.audio_info.frames = 197530;
    a.audio_info.codec = "WAV/PCM_16";
    a.segments = {{0.0, 12.3456, "speech", ""}};
    a.speech_segments = 3;
    a.energy.mean_db = -23.4567;
    a.energy.variability_db = 8.005;
    a.pitch.mean_hz = 187.456;
    a.pitch.variability_hz = 23.4449;

    std::string json = analysis_to_json(a);
    CHECK(json.find("\"duration_sec\": 12.35") != std::string::npos);
    CHECK(json.find("\"sample_rate\": 16000") != std::string::npos);
    CHECK(json.find("\"frames\": 197530") != std::string::npos);
    CHECK(json.find("\"codec\": \"WAV/PCM_16\"") != std::string::npos);
    CHECK(json.find("\"speech_segments\": 3") != std::string::npos);
    CHECK(json.find("\"average_pitch_hz\": 187.46") != std::string::npos);
    CHECK(json.find("\"pitch_variance\": 23.44") != std::string::npos);
    CHECK(json.find("\"mean_energy_db\": -23.46") != std::string::npos);
    CHECK(json.find("\"speech_rate_wpm\": null") != std::string::npos);
    CHECK(json.find("\"end_time_sec\": 12.3456") != std::string::npos);

    a.speech_rate_wpm = 142;
    CHECK(analysis_to_json(a).find("\"speech_rate_wpm\": 142") != std::string::npos);
}

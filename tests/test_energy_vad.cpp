// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "energy_vad.h"

#include <cmath>

using namespace sonix;
using Catch::Matchers::WithinAbs;

static void append_tone(std::vector<float>& out, int sample_rate, double seconds,
                        float amplitude = 0.5f, double freq = 440.0) {
    size_t n = static_cast<size_t>(seconds * sample_rate);
    for (size_t i = 0; i < n; ++i)
        out.push_back(amplitude * static_cast<float>(std::sin(2.0 * M_PI * freq * i / sample_rate)));
}

static void append_silence(std::vector<float>& out, int sample_rate, double seconds) {
    out.insert(out.end(), static_cast<size_t>(seconds * sample_rate), 0.0f);
}

// ---------------------------------------------------------------------------
// frame_rms
// ---------------------------------------------------------------------------

TEST_CASE("frame_rms: frame count is 1 + size / hop", "[energy_vad]") {
    std::vector<float> samples(16000, 0.1f);
    CHECK(frame_rms(samples, 2048, 512).size() == 32);
    CHECK(frame_rms(std::vector<float>(100, 0.1f), 2048, 512).size() == 1);
}

TEST_CASE("frame_rms: centered frames are zero padded at the edges", "[energy_vad]") {
    std::vector<float> samples(16000, 0.5f);
    auto rms = frame_rms(samples, 2048, 512);
    // First frame is half padding
    CHECK_THAT(rms[0], WithinAbs(std::sqrt(0.125), 1e-5));
    // Interior frames see the full constant signal
    CHECK_THAT(rms[10], WithinAbs(0.5, 1e-5));
}

TEST_CASE("frame_rms: rejects non-positive frame or hop", "[energy_vad]") {
    std::vector<float> samples(100, 0.1f);
    CHECK_THROWS_AS(frame_rms(samples, 0, 512), SonixError);
    CHECK_THROWS_AS(frame_rms(samples, 2048, 0), SonixError);
}

// ---------------------------------------------------------------------------
// split_nonsilent
// ---------------------------------------------------------------------------

TEST_CASE("split_nonsilent: digital silence has no active ranges", "[energy_vad]") {
    Waveform wav;
    wav.sample_rate = 16000;
    wav.samples.assign(32000, 0.0f);
    CHECK(split_nonsilent(wav).empty());
}

TEST_CASE("split_nonsilent: finds a tone burst between silences", "[energy_vad]") {
    Waveform wav;
    wav.sample_rate = 16000;
    append_silence(wav.samples, 16000, 1.0);
    append_tone(wav.samples, 16000, 1.0);
    append_silence(wav.samples, 16000, 1.0);

    auto ranges = split_nonsilent(wav);
    REQUIRE(ranges.size() == 1);
    // Hop-aligned, widened by the centered frame
    CHECK(ranges[0].start_sample >= 15000);
    CHECK(ranges[0].start_sample <= 16000);
    CHECK(ranges[0].end_sample >= 32000);
    CHECK(ranges[0].end_sample <= 34000);
    CHECK(ranges[0].start_sample % 512 == 0);
}

TEST_CASE("split_nonsilent: separate bursts give separate ranges", "[energy_vad]") {
    Waveform wav;
    wav.sample_rate = 16000;
    append_tone(wav.samples, 16000, 0.5);
    append_silence(wav.samples, 16000, 1.0);
    append_tone(wav.samples, 16000, 0.5);

    auto ranges = split_nonsilent(wav);
    REQUIRE(ranges.size() == 2);
    CHECK(ranges[0].start_sample == 0);
    CHECK(ranges[0].end_sample < ranges[1].start_sample);
    CHECK(ranges[1].end_sample == static_cast<int64_t>(wav.samples.size()));
}

TEST_CASE("split_nonsilent: quiet passage is silence relative to the peak", "[energy_vad]") {
    Waveform wav;
    wav.sample_rate = 16000;
    append_tone(wav.samples, 16000, 1.0, 0.5f);
    append_tone(wav.samples, 16000, 1.0, 0.001f);  // about -54 dB below

    auto strict = split_nonsilent(wav);
    REQUIRE(strict.size() == 1);
    CHECK(strict[0].end_sample < 18000);

    EnergyVadConfig lenient;
    lenient.top_db = 60.0f;
    auto loose = split_nonsilent(wav, lenient);
    REQUIRE(loose.size() == 1);
    CHECK(loose[0].end_sample == 32000);
}

TEST_CASE("split_nonsilent: empty waveform throws", "[energy_vad]") {
    Waveform wav;
    wav.sample_rate = 16000;
    CHECK_THROWS_AS(split_nonsilent(wav), AudioInputError);
}

// ---------------------------------------------------------------------------
// energy_stats
// ---------------------------------------------------------------------------

TEST_CASE("energy_stats: empty input is zero", "[energy_vad]") {
    auto stats = energy_stats({});
    CHECK(stats.mean_db == 0.0);
    CHECK(stats.variability_db == 0.0);
}

TEST_CASE("energy_stats: digital silence sits at the power floor", "[energy_vad]") {
    auto stats = energy_stats(std::vector<float>(16000, 0.0f));
    CHECK_THAT(stats.mean_db, WithinAbs(-100.0, 1e-6));
    CHECK_THAT(stats.variability_db, WithinAbs(0.0, 1e-6));
}

TEST_CASE("energy_stats: steady signal has low variability", "[energy_vad]") {
    std::vector<float> samples(160000, 0.5f);
    auto stats = energy_stats(samples);
    // 10*log10(0.25)
    CHECK_THAT(stats.mean_db, WithinAbs(-6.02, 0.1));
    CHECK(stats.variability_db < 1.0);
}

TEST_CASE("energy_stats: silence is clipped to 80 dB below the peak", "[energy_vad]") {
    std::vector<float> samples;
    append_tone(samples, 16000, 1.0, 0.5f);
    append_silence(samples, 16000, 1.0);

    auto stats = energy_stats(samples);
    // Half the frames near -9 dB, the rest clipped near -89 dB
    CHECK(stats.mean_db > -90.0);
    CHECK(stats.mean_db < -30.0);
    CHECK(stats.variability_db > 30.0);
    CHECK(stats.variability_db <= 40.5);
}

TEST_CASE("one frame_rms pass serves both ranges and statistics", "[energy_vad]") {
    Waveform wav;
    wav.sample_rate = 16000;
    append_silence(wav.samples, 16000, 0.5);
    append_tone(wav.samples, 16000, 0.5);
    append_silence(wav.samples, 16000, 1.0);
    append_tone(wav.samples, 16000, 0.5, 0.2f);

    EnergyVadConfig cfg;
    auto rms = frame_rms(wav.samples, cfg.frame_length, cfg.hop_length);

    auto shared = active_ranges_from_rms(rms, wav.size(), cfg);
    auto direct = split_nonsilent(wav, cfg);
    REQUIRE(shared.size() == direct.size());
    for (size_t i = 0; i < shared.size(); ++i) {
        CHECK(shared[i].start_sample == direct[i].start_sample);
        CHECK(shared[i].end_sample == direct[i].end_sample);
    }

    auto from_rms = energy_stats_from_rms(rms);
    auto from_samples = energy_stats(wav.samples, cfg.frame_length, cfg.hop_length);
    CHECK(from_rms.mean_db == from_samples.mean_db);
    CHECK(from_rms.variability_db == from_samples.variability_db);
}

TEST_CASE("active_ranges_from_rms: ranges are clamped to the sample count", "[energy_vad]") {
    EnergyVadConfig cfg;
    std::vector<float> rms = {0.0f, 0.5f, 0.5f, 0.5f};
    auto ranges = active_ranges_from_rms(rms, 1200, cfg);
    REQUIRE(ranges.size() == 1);
    CHECK(ranges[0].start_sample == 512);
    CHECK(ranges[0].end_sample == 1200);
}

// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "segment.h"
#include "util.h"

using namespace sonix;
using Catch::Matchers::WithinAbs;

TEST_CASE("format_segments: converts samples to seconds", "[segment]") {
    std::vector<Interval> in = {{0, 8000, false}, {8000, 24000, true}, {24000, 32000, false}};
    auto out = format_segments(in, 16000, 32000);

    REQUIRE(out.size() == 3);
    CHECK(out[0].label == "silence");
    CHECK(out[1].label == "speech");
    CHECK(out[2].label == "silence");
    CHECK_THAT(out[0].start_time_sec, WithinAbs(0.0, 1e-9));
    CHECK_THAT(out[0].end_time_sec, WithinAbs(0.5, 1e-9));
    CHECK_THAT(out[1].end_time_sec, WithinAbs(1.5, 1e-9));
    CHECK_THAT(out[2].end_time_sec, WithinAbs(2.0, 1e-9));
    CHECK(out[1].transcript.empty());
}

TEST_CASE("format_segments: consecutive segments touch", "[segment]") {
    std::vector<Interval> in = {{0, 100, true}, {100, 4410, false}, {4410, 44100, true}};
    auto out = format_segments(in, 44100, 44100);
    for (size_t i = 1; i < out.size(); ++i)
        CHECK(out[i].start_time_sec == out[i - 1].end_time_sec);
}

TEST_CASE("format_segments: padding widens speech and clamps to bounds", "[segment]") {
    std::vector<Interval> in = {{0, 100, true}, {100, 900, false}, {900, 1000, true}};
    auto out = format_segments(in, 1000, 1000, 50);

    REQUIRE(out.size() == 3);
    CHECK_THAT(out[0].start_time_sec, WithinAbs(0.0, 1e-9));
    CHECK_THAT(out[0].end_time_sec, WithinAbs(0.15, 1e-9));
    // silence left as is
    CHECK_THAT(out[1].start_time_sec, WithinAbs(0.1, 1e-9));
    CHECK_THAT(out[1].end_time_sec, WithinAbs(0.9, 1e-9));
    CHECK_THAT(out[2].start_time_sec, WithinAbs(0.85, 1e-9));
    CHECK_THAT(out[2].end_time_sec, WithinAbs(1.0, 1e-9));
}

TEST_CASE("format_segments: empty input yields empty output", "[segment]") {
    CHECK(format_segments({}, 16000, 0).empty());
}

TEST_CASE("format_segments: rejects non-positive sample rate", "[segment]") {
    CHECK_THROWS_AS(format_segments({{0, 10, true}}, 0, 10), AudioInputError);
    CHECK_THROWS_AS(format_segments({{0, 10, true}}, -8000, 10), AudioInputError);
}

TEST_CASE("Segment: duration and silence flag", "[segment]") {
    Segment s{1.25, 3.75, LABEL_SILENCE, ""};
    CHECK(s.duration() == 2.5);
    CHECK(s.is_silence());
    Segment spk{0.0, 1.0, "Speaker_01", ""};
    CHECK_FALSE(spk.is_silence());
}

TEST_CASE("format_timestamp: minutes, seconds, milliseconds", "[segment]") {
    CHECK(format_timestamp(0.0) == "00:00.000");
    CHECK(format_timestamp(1.5) == "00:01.500");
    CHECK(format_timestamp(65.25) == "01:05.250");
    CHECK(format_timestamp(-3.0) == "00:00.000");
}

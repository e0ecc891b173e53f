// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include <catch2/catch_test_macros.hpp>
#include "cli.h"

#include <cstdlib>
#include <getopt.h>
#include <vector>

using namespace sonix;

// Helper to build argv and call parse_cli against a config file that does not exist,
// so only built-in defaults and flags apply.
static CliResult run_cli(std::initializer_list<const char*> args) {
    std::vector<char*> argv;
    for (const char* a : args)
        argv.push_back(const_cast<char*>(a));
    argv.push_back(nullptr);

    optind = 0;
    unsetenv(TOKEN_ENV_VAR);

    fs::path no_config = fs::temp_directory_path() / "sonix_test_cli" / "absent.yaml";
    return parse_cli(static_cast<int>(argv.size() - 1), argv.data(), no_config);
}

TEST_CASE("parse_cli: positional argument is the input file", "[cli]") {
    auto cli = run_cli({"sonix", "talk.wav"});
    CHECK(cli.input_path == fs::path("talk.wav"));
    CHECK_FALSE(cli.show_help);
    CHECK_FALSE(cli.show_version);
    CHECK_FALSE(cli.segments_only);
    CHECK(cli.output_path.empty());
    CHECK(cli.cfg.top_db == 40.0f);
}

TEST_CASE("parse_cli: missing input shows help", "[cli]") {
    auto cli = run_cli({"sonix"});
    CHECK(cli.show_help);
    CHECK(cli.input_path.empty());
}

TEST_CASE("parse_cli: VAD flags", "[cli]") {
    auto cli = run_cli({"sonix", "--top-db", "30", "--min-silence-gap", "0.4",
                        "--pad", "0.1", "--neural-vad", "--neural-threshold", "0.65", "a.flac"});
    CHECK(cli.cfg.top_db == 30.0f);
    CHECK(cli.cfg.min_silence_gap_sec == 0.4);
    CHECK(cli.cfg.pad_sec == 0.1);
    CHECK(cli.cfg.neural_vad);
    CHECK(cli.cfg.neural_threshold == 0.65f);
    CHECK(cli.input_path == fs::path("a.flac"));
}

TEST_CASE("parse_cli: diarization flags", "[cli]") {
    auto cli = run_cli({"sonix", "--hf-token", "hf_cli", "--num-speakers", "3",
                        "--cluster-threshold", "0.8", "a.wav"});
    CHECK(cli.cfg.hf_token == "hf_cli");
    CHECK(cli.cfg.num_speakers == 3);
    CHECK(cli.cfg.cluster_threshold == 0.8f);
    CHECK(cli.cfg.diarize);

    auto off = run_cli({"sonix", "--no-diarize", "a.wav"});
    CHECK_FALSE(off.cfg.diarize);
}

TEST_CASE("parse_cli: transcription and performance flags", "[cli]") {
    auto cli = run_cli({"sonix", "--model", "tiny", "--language", "fr", "--threads", "2", "a.wav"});
    CHECK(cli.cfg.whisper_model == "tiny");
    CHECK(cli.cfg.language == "fr");
    CHECK(cli.cfg.threads == 2);
}

TEST_CASE("parse_cli: output and mode flags", "[cli]") {
    auto cli = run_cli({"sonix", "-o", "out.json", "--segments-only", "--list",
                        "--log-level", "info", "--log-dir", "/tmp/l", "a.wav"});
    CHECK(cli.output_path == fs::path("out.json"));
    CHECK(cli.segments_only);
    CHECK(cli.list_segments);
    CHECK(cli.cfg.log_level_str == "info");
    CHECK(cli.cfg.log_dir == fs::path("/tmp/l"));

    auto long_form = run_cli({"sonix", "--output", "x.json", "a.wav"});
    CHECK(long_form.output_path == fs::path("x.json"));
}

TEST_CASE("parse_cli: flags after the input file are accepted", "[cli]") {
    auto cli = run_cli({"sonix", "a.wav", "--top-db", "25"});
    CHECK(cli.input_path == fs::path("a.wav"));
    CHECK(cli.cfg.top_db == 25.0f);
}

TEST_CASE("parse_cli: --help and --version", "[cli]") {
    CHECK(run_cli({"sonix", "--help"}).show_help);
    CHECK(run_cli({"sonix", "-h"}).show_help);
    CHECK(run_cli({"sonix", "--version"}).show_version);
    CHECK(run_cli({"sonix", "-v"}).show_version);
}

TEST_CASE("parse_cli: unknown flag shows help", "[cli]") {
    CHECK(run_cli({"sonix", "--bogus", "a.wav"}).show_help);
}

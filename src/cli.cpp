// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "cli.h"

#include <cstdlib>
#include <getopt.h>

namespace sonix {

CliResult parse_cli(int argc, char* argv[], const fs::path& config_path) {
    static const struct option long_opts[] = {
        {"top-db",            required_argument, nullptr, 't'},
        {"min-silence-gap",   required_argument, nullptr, 'g'},
        {"pad",               required_argument, nullptr, 'p'},
        {"neural-vad",        no_argument,       nullptr, 'n'},
        {"neural-threshold",  required_argument, nullptr, 'T'},
        {"hf-token",          required_argument, nullptr, 'k'},
        {"no-diarize",        no_argument,       nullptr, 'D'},
        {"num-speakers",      required_argument, nullptr, 'S'},
        {"cluster-threshold", required_argument, nullptr, 'C'},
        {"model",             required_argument, nullptr, 'W'},
        {"language",          required_argument, nullptr, 'L'},
        {"threads",           required_argument, nullptr, 'j'},
        {"log-level",         required_argument, nullptr, 'l'},
        {"log-dir",           required_argument, nullptr, 'd'},
        {"output",            required_argument, nullptr, 'o'},
        {"segments-only",     no_argument,       nullptr, 's'},
        {"list",              no_argument,       nullptr, 'P'},
        {"help",              no_argument,       nullptr, 'h'},
        {"version",           no_argument,       nullptr, 'v'},
        {nullptr, 0, nullptr, 0},
    };

    CliResult result;
    result.cfg = load_config(config_path);

    // getopt keeps global state; reset so parse_cli can be called repeatedly
    optind = 0;
    opterr = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, "ho:v", long_opts, nullptr)) != -1) {
        switch (opt) {
            case 't': result.cfg.top_db = std::strtof(optarg, nullptr); break;
            case 'g': result.cfg.min_silence_gap_sec = std::strtod(optarg, nullptr); break;
            case 'p': result.cfg.pad_sec = std::strtod(optarg, nullptr); break;
            case 'n': result.cfg.neural_vad = true; break;
            case 'T': result.cfg.neural_threshold = std::strtof(optarg, nullptr); break;
            case 'k': result.cfg.hf_token = optarg; break;
            case 'D': result.cfg.diarize = false; break;
            case 'S': result.cfg.num_speakers = std::atoi(optarg); break;
            case 'C': result.cfg.cluster_threshold = std::strtof(optarg, nullptr); break;
            case 'W': result.cfg.whisper_model = optarg; break;
            case 'L': result.cfg.language = optarg; break;
            case 'j': result.cfg.threads = std::atoi(optarg); break;
            case 'l': result.cfg.log_level_str = optarg; break;
            case 'd': result.cfg.log_dir = optarg; break;
            case 'o': result.output_path = optarg; break;
            case 's': result.segments_only = true; break;
            case 'P': result.list_segments = true; break;
            case 'v': result.show_version = true; return result;
            case 'h': result.show_help = true; return result;
            default:  result.show_help = true; return result;
        }
    }

    if (optind < argc)
        result.input_path = argv[optind];
    else
        result.show_help = true;

    return result;
}

} // namespace sonix

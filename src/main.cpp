// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "analysis.h"
#include "cli.h"
#include "config.h"
#include "log.h"
#include "model_manager.h"
#include "report.h"
#include "util.h"
#include "version.h"

#include <cstdio>
#include <memory>

using namespace sonix;

static void print_usage() {
    fprintf(stderr,
        "Usage: sonix [OPTIONS] AUDIO_FILE\n"
        "\n"
        "Segment a recording into speech and silence (or speakers) and report\n"
        "acoustic features as JSON.\n"
        "\n"
        "Options:\n"
        "  --top-db DB             Silence threshold below peak (default: 40)\n"
        "  --min-silence-gap SEC   Shorter silences are absorbed into speech (default: 1.0)\n"
        "  --pad SEC               Extend speech segments on both sides (default: 0)\n"
        "  --neural-vad            Use Silero VAD before the energy detector\n"
        "  --neural-threshold P    Speech probability threshold (default: 0.5)\n"
        "  --hf-token TOKEN        Credential for speaker diarization (default: $HF_TOKEN)\n"
        "  --no-diarize            Disable speaker diarization\n"
        "  --num-speakers N        Number of speakers (0 = auto-detect, default: 0)\n"
        "  --cluster-threshold F   Clustering distance threshold (default: 1.18, higher = fewer speakers)\n"
        "  --model NAME|PATH       Whisper model for speech rate: tiny/base/small/medium/large-v3\n"
        "  --language CODE         Force whisper language (e.g. en, de, ja; default: auto-detect)\n"
        "  --threads N             Number of CPU threads for inference (0 = auto-detect, default: 0)\n"
        "  --log-level LEVEL       none, error, warn, info (default: none)\n"
        "  --log-dir DIR           Log directory (default: ~/.local/share/sonix/logs)\n"
        "  -o, --output FILE       Write JSON to FILE instead of stdout\n"
        "  --segments-only         Only segment, skip feature extraction\n"
        "  --list                  Print segments to stderr\n"
        "  -h, --help              Show this help\n"
        "  -v, --version           Show version\n"
    );
}

static void print_version() {
    printf("sonix %s\n", SONIX_VERSION);
}

static void print_segments(const std::vector<Segment>& segments) {
    for (const auto& s : segments) {
        fprintf(stderr, "[%s - %s] %s\n",
                format_timestamp(s.start_time_sec).c_str(),
                format_timestamp(s.end_time_sec).c_str(), s.label.c_str());
    }
}

int main(int argc, char* argv[]) {
    CliResult cli;
    try {
        cli = parse_cli(argc, argv);
    } catch (const SonixError& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }
    if (cli.show_version) { print_version(); return 0; }
    if (cli.show_help) { print_usage(); return 0; }
    const Config& cfg = cli.cfg;

    try {
        log_init(parse_log_level(cfg.log_level_str), cfg.log_dir);
    } catch (const fs::filesystem_error& e) {
        fprintf(stderr, "Warning: logging disabled: %s\n", e.what());
    }
    log_info("sonix %s: analyzing %s", SONIX_VERSION, cli.input_path.c_str());

    AnalysisOptions options;
    options.vad = cfg.vad_params();
    options.diarize = cfg.diarize;
    options.credential = cfg.hf_token;
    options.language = cfg.language;
    options.threads = cfg.threads;

    AnalysisBackends backends;

#if SONIX_USE_SHERPA
    std::unique_ptr<SherpaVadBackend> silero;
    if (cfg.neural_vad) {
        try {
            SileroVadConfig vad_cfg;
            vad_cfg.threshold = cfg.neural_threshold;
            silero = std::make_unique<SherpaVadBackend>(ensure_vad_model(), vad_cfg, cfg.threads);
            backends.vad = silero.get();
        } catch (const std::exception& e) {
            log_warn("Neural VAD unavailable: %s", e.what());
            fprintf(stderr, "Warning: neural VAD unavailable (%s), using energy VAD.\n", e.what());
        }
    }

    if (cfg.diarize) {
        SherpaDiarizerConfig dcfg;
        dcfg.num_speakers = cfg.num_speakers;
        dcfg.cluster_threshold = cfg.cluster_threshold;
        dcfg.threads = cfg.threads;
        backends.diarization = sherpa_diarization_loader(dcfg);
    }
#else
    if (cfg.neural_vad)
        fprintf(stderr, "Warning: neural VAD requires sherpa-onnx support (not compiled in).\n");
    if (cfg.diarize && !cfg.hf_token.empty()) {
        fprintf(stderr, "Warning: Diarization requires sherpa-onnx support (not compiled in).\n");
        fprintf(stderr, "Rebuild with: cmake -DSONIX_USE_SHERPA=ON, or use --no-diarize to suppress.\n");
    }
#endif

    int rc = 0;
    try {
        std::string json;
        if (cli.segments_only) {
            Waveform wav = read_audio(cli.input_path);
            auto segments = segment_waveform(wav, options, backends);
            if (cli.list_segments)
                print_segments(segments);
            json = segments_to_json(segments);
        } else {
            std::unique_ptr<WhisperModel> whisper;
            if (!cfg.whisper_model.empty()) {
                try {
                    whisper = std::make_unique<WhisperModel>(resolve_whisper_model(cfg.whisper_model));
                    backends.whisper = whisper.get();
                } catch (const std::exception& e) {
                    log_warn("Speech rate unavailable: %s", e.what());
                    fprintf(stderr, "Warning: %s\n", e.what());
                }
            }
            auto analysis = analyze_audio(cli.input_path, options, backends);
            if (cli.list_segments)
                print_segments(analysis.segments);
            json = analysis_to_json(analysis);
        }

        if (cli.output_path.empty()) {
            fputs(json.c_str(), stdout);
        } else {
            write_text_file(cli.output_path, json);
            log_info("Report written to %s", cli.output_path.c_str());
        }
    } catch (const SonixError& e) {
        log_error("%s", e.what());
        fprintf(stderr, "Error: %s\n", e.what());
        rc = 1;
    } catch (const std::exception& e) {
        log_error("Unexpected error: %s", e.what());
        fprintf(stderr, "Unexpected error: %s\n", e.what());
        rc = 1;
    }

    log_shutdown();
    return rc;
}

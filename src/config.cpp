// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "config.h"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace sonix {

namespace {

// Simple YAML parser: handles flat key: value and one level of nesting.

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && ((s.front() == '"' && s.back() == '"') ||
                           (s.front() == '\'' && s.back() == '\'')))
        return s.substr(1, s.size() - 2);
    return s;
}

struct YamlEntry {
    std::string key;
    std::string value;
    int indent;
};

std::vector<YamlEntry> parse_yaml(const std::string& text) {
    std::vector<YamlEntry> entries;
    std::istringstream stream(text);
    std::string line;

    while (std::getline(stream, line)) {
        auto trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') continue;

        int indent = 0;
        while (indent < (int)line.size() && line[indent] == ' ') indent++;

        auto colon = trimmed.find(':');
        if (colon == std::string::npos) continue;

        std::string key = trim(trimmed.substr(0, colon));
        std::string val = trim(trimmed.substr(colon + 1));
        entries.push_back({key, unquote(val), indent});
    }
    return entries;
}

std::string get_val(const std::vector<YamlEntry>& entries,
                    const std::string& section, const std::string& key,
                    const std::string& def = "") {
    bool in_section = false;
    for (const auto& e : entries) {
        if (e.indent == 0) {
            in_section = (e.key == section && e.value.empty());
            continue;
        }
        if (in_section && e.key == key)
            return e.value;
    }
    return def;
}

bool get_bool(const std::vector<YamlEntry>& entries,
              const std::string& section, const std::string& key, bool def) {
    std::string val = get_val(entries, section, key);
    if (val.empty()) return def;
    return val == "true" || val == "yes" || val == "1";
}

// Unparseable numbers keep the default.
double get_double(const std::vector<YamlEntry>& entries,
                  const std::string& section, const std::string& key, double def) {
    std::string val = get_val(entries, section, key);
    if (val.empty()) return def;
    char* end = nullptr;
    double d = std::strtod(val.c_str(), &end);
    return (end && *end == '\0') ? d : def;
}

int get_int(const std::vector<YamlEntry>& entries,
            const std::string& section, const std::string& key, int def) {
    std::string val = get_val(entries, section, key);
    if (val.empty()) return def;
    char* end = nullptr;
    long n = std::strtol(val.c_str(), &end, 10);
    return (end && *end == '\0') ? static_cast<int>(n) : def;
}

fs::path default_config_path() {
    return config_dir() / "config.yaml";
}

} // anonymous namespace

VadParams Config::vad_params() const {
    VadParams p;
    p.top_db = top_db;
    p.min_silence_gap_sec = min_silence_gap_sec;
    p.pad_sec = pad_sec;
    p.neural_threshold = neural_threshold;
    return p;
}

Config load_config(const fs::path& config_path) {
    Config cfg;
    fs::path path = config_path.empty() ? default_config_path() : config_path;

    if (const char* token = std::getenv(TOKEN_ENV_VAR))
        cfg.hf_token = token;

    if (!fs::exists(path))
        return cfg;

    std::ifstream in(path);
    if (!in) return cfg;

    std::ostringstream buf;
    buf << in.rdbuf();
    auto entries = parse_yaml(buf.str());

    // VAD section
    cfg.top_db = static_cast<float>(get_double(entries, "vad", "top_db", cfg.top_db));
    cfg.min_silence_gap_sec = get_double(entries, "vad", "min_silence_gap", cfg.min_silence_gap_sec);
    cfg.pad_sec = get_double(entries, "vad", "pad", cfg.pad_sec);
    cfg.neural_vad = get_bool(entries, "vad", "neural", cfg.neural_vad);
    cfg.neural_threshold = static_cast<float>(
        get_double(entries, "vad", "neural_threshold", cfg.neural_threshold));

    // Diarization section
    cfg.diarize = get_bool(entries, "diarization", "enabled", cfg.diarize);
    std::string file_token = get_val(entries, "diarization", "token");
    if (!file_token.empty())
        cfg.hf_token = file_token;
    cfg.num_speakers = get_int(entries, "diarization", "num_speakers", cfg.num_speakers);
    cfg.cluster_threshold = static_cast<float>(
        get_double(entries, "diarization", "cluster_threshold", cfg.cluster_threshold));

    // Transcription section
    cfg.whisper_model = get_val(entries, "transcription", "model", cfg.whisper_model);
    cfg.language = get_val(entries, "transcription", "language", cfg.language);

    // General section
    cfg.threads = get_int(entries, "general", "threads", cfg.threads);

    // Logging section
    cfg.log_level_str = get_val(entries, "logging", "level", cfg.log_level_str);
    std::string dir = get_val(entries, "logging", "directory");
    if (!dir.empty()) cfg.log_dir = dir;

    return cfg;
}

void save_config(const Config& cfg, const fs::path& config_path) {
    fs::path path = config_path.empty() ? default_config_path() : config_path;
    if (path.has_parent_path())
        fs::create_directories(path.parent_path());

    std::ofstream out(path);
    if (!out)
        throw SonixError("Cannot write config: " + path.string());

    out << "# sonix configuration\n\n"
        << "vad:\n"
        << "  top_db: " << cfg.top_db << "\n"
        << "  min_silence_gap: " << cfg.min_silence_gap_sec << "\n"
        << "  pad: " << cfg.pad_sec << "\n"
        << "  neural: " << (cfg.neural_vad ? "true" : "false") << "\n"
        << "  neural_threshold: " << cfg.neural_threshold << "\n";

    out << "\ndiarization:\n"
        << "  enabled: " << (cfg.diarize ? "true" : "false") << "\n";
    if (cfg.num_speakers > 0)
        out << "  num_speakers: " << cfg.num_speakers << "\n";
    out << "  cluster_threshold: " << cfg.cluster_threshold << "\n";

    if (!cfg.whisper_model.empty() || !cfg.language.empty()) {
        out << "\ntranscription:\n";
        if (!cfg.whisper_model.empty())
            out << "  model: \"" << cfg.whisper_model << "\"\n";
        if (!cfg.language.empty())
            out << "  language: " << cfg.language << "\n";
    }

    if (cfg.threads > 0) {
        out << "\ngeneral:\n"
            << "  threads: " << cfg.threads << "\n";
    }

    if (!cfg.log_level_str.empty() || !cfg.log_dir.empty()) {
        out << "\nlogging:\n";
        if (!cfg.log_level_str.empty())
            out << "  level: " << cfg.log_level_str << "\n";
        if (!cfg.log_dir.empty())
            out << "  directory: \"" << cfg.log_dir.string() << "\"\n";
    }

    if (!out)
        throw SonixError("Write failed: " + path.string());
}

} // namespace sonix

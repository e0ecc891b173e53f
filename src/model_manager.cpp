// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "model_manager.h"
#include "http_client.h"
#include "log.h"

#include <fstream>
#include <map>

namespace sonix {

namespace {

struct ModelInfo {
    std::string url;
    std::string filename;
};

// Whisper GGUF models hosted on Hugging Face
const std::map<std::string, ModelInfo> WHISPER_MODELS = {
    {"tiny",     {"https://huggingface.co/ggerganov/whisper.cpp/resolve/main/ggml-tiny.bin",     "ggml-tiny.bin"}},
    {"base",     {"https://huggingface.co/ggerganov/whisper.cpp/resolve/main/ggml-base.bin",     "ggml-base.bin"}},
    {"small",    {"https://huggingface.co/ggerganov/whisper.cpp/resolve/main/ggml-small.bin",    "ggml-small.bin"}},
    {"medium",   {"https://huggingface.co/ggerganov/whisper.cpp/resolve/main/ggml-medium.bin",   "ggml-medium.bin"}},
    {"large-v3", {"https://huggingface.co/ggerganov/whisper.cpp/resolve/main/ggml-large-v3.bin", "ggml-large-v3.bin"}},
};

bool is_cached(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
        return false;
    auto size = fs::file_size(path, ec);
    return !ec && size > 0;
}

const ModelInfo& whisper_info(const std::string& model_name) {
    auto it = WHISPER_MODELS.find(model_name);
    if (it == WHISPER_MODELS.end())
        throw SonixError("Unknown whisper model: " + model_name +
                         ". Available: tiny, base, small, medium, large-v3");
    return it->second;
}

void download_file(const std::string& url, const fs::path& dest,
                   const std::map<std::string, std::string>& headers = {}) {
    log_info("Downloading %s ...", url.c_str());
    auto data = http_get(url, headers);
    store_download(dest, data);
    log_info("Downloaded: %s (%.1f MB)", dest.filename().c_str(),
             data.size() / (1024.0 * 1024.0));
}

} // anonymous namespace

void store_download(const fs::path& dest, const std::string& data) {
    fs::create_directories(dest.parent_path());
    fs::path partial = dest.string() + ".part";
    try {
        {
            std::ofstream out(partial, std::ios::binary);
            if (!out)
                throw SonixError("Cannot write to: " + partial.string());
            out.write(data.data(), static_cast<std::streamsize>(data.size()));
            if (!out)
                throw SonixError("Write failed: " + partial.string());
        }
        fs::rename(partial, dest);
    } catch (...) {
        std::error_code ec;
        fs::remove(partial, ec);
        throw;
    }
}

bool is_whisper_model_cached(const std::string& model_name) {
    return is_cached(models_dir() / "whisper" / whisper_info(model_name).filename);
}

fs::path ensure_whisper_model(const std::string& model_name) {
    const auto& info = whisper_info(model_name);
    fs::path model_path = models_dir() / "whisper" / info.filename;
    if (!is_cached(model_path))
        download_file(info.url, model_path);
    return model_path;
}

fs::path resolve_whisper_model(const std::string& name_or_path) {
    fs::path as_path(name_or_path);
    if (is_cached(as_path))
        return as_path;
    return ensure_whisper_model(name_or_path);
}

#if SONIX_USE_SHERPA
namespace {

const char* SILERO_VAD_URL =
    "https://github.com/k2-fsa/sherpa-onnx/releases/download/asr-models/silero_vad.onnx";

const char* SHERPA_SEGMENTATION_URL =
    "https://huggingface.co/csukuangfj/sherpa-onnx-pyannote-segmentation-3-0/"
    "resolve/main/model.onnx";

const char* SHERPA_EMBEDDING_URL =
    "https://huggingface.co/csukuangfj/speaker-embedding-models/resolve/main/"
    "3dspeaker_speech_eres2net_base_sv_zh-cn_3dspeaker_16k.onnx";

fs::path vad_model_path() {
    return models_dir() / "sherpa" / "vad" / "silero_vad.onnx";
}

fs::path sherpa_seg_path() {
    return models_dir() / "sherpa" / "segmentation" / "model.onnx";
}

fs::path sherpa_emb_path() {
    return models_dir() / "sherpa" / "embedding" /
           "3dspeaker_speech_eres2net_base_sv_zh-cn_3dspeaker_16k.onnx";
}

} // anonymous namespace

bool is_vad_model_cached() {
    return is_cached(vad_model_path());
}

fs::path ensure_vad_model() {
    fs::path path = vad_model_path();
    if (!is_cached(path))
        download_file(SILERO_VAD_URL, path);
    return path;
}

bool is_sherpa_model_cached() {
    return is_cached(sherpa_seg_path()) && is_cached(sherpa_emb_path());
}

SherpaModelPaths ensure_sherpa_models(const std::string& token) {
    auto seg = sherpa_seg_path();
    auto emb = sherpa_emb_path();
    auto headers = bearer_headers(token);

    if (!is_cached(seg))
        download_file(SHERPA_SEGMENTATION_URL, seg, headers);
    if (!is_cached(emb))
        download_file(SHERPA_EMBEDDING_URL, emb, headers);

    return {seg, emb};
}
#endif

} // namespace sonix

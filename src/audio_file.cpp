// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "audio_file.h"
#include "log.h"

#include <sndfile.h>

namespace sonix {

namespace {

const char* major_format_name(int major) {
    switch (major) {
        case SF_FORMAT_WAV:   return "WAV";
        case SF_FORMAT_AIFF:  return "AIFF";
        case SF_FORMAT_AU:    return "AU";
        case SF_FORMAT_RAW:   return "RAW";
        case SF_FORMAT_W64:   return "W64";
        case SF_FORMAT_WAVEX: return "WAVEX";
        case SF_FORMAT_FLAC:  return "FLAC";
        case SF_FORMAT_CAF:   return "CAF";
        case SF_FORMAT_OGG:   return "OGG";
        case SF_FORMAT_RF64:  return "RF64";
        default:              return "unknown";
    }
}

const char* subtype_name(int subtype) {
    switch (subtype) {
        case SF_FORMAT_PCM_S8: return "PCM_S8";
        case SF_FORMAT_PCM_16: return "PCM_16";
        case SF_FORMAT_PCM_24: return "PCM_24";
        case SF_FORMAT_PCM_32: return "PCM_32";
        case SF_FORMAT_PCM_U8: return "PCM_U8";
        case SF_FORMAT_FLOAT:  return "FLOAT";
        case SF_FORMAT_DOUBLE: return "DOUBLE";
        case SF_FORMAT_ULAW:   return "ULAW";
        case SF_FORMAT_ALAW:   return "ALAW";
        case SF_FORMAT_VORBIS: return "VORBIS";
        default:               return "unknown";
    }
}

// Owns an open SNDFILE handle.
class SoundFile {
public:
    SoundFile(const fs::path& path, int mode, SF_INFO& info)
        : sf_(sf_open(path.c_str(), mode, &info)) {}
    ~SoundFile() { if (sf_) sf_close(sf_); }

    SoundFile(const SoundFile&) = delete;
    SoundFile& operator=(const SoundFile&) = delete;

    SNDFILE* get() const { return sf_; }
    explicit operator bool() const { return sf_ != nullptr; }

private:
    SNDFILE* sf_;
};

} // anonymous namespace

std::string codec_name(int sf_format) {
    return std::string(major_format_name(sf_format & SF_FORMAT_TYPEMASK)) + "/" +
           subtype_name(sf_format & SF_FORMAT_SUBMASK);
}

void validate_waveform(const Waveform& wav) {
    if (wav.sample_rate <= 0)
        throw AudioInputError("Invalid sample rate: " + std::to_string(wav.sample_rate));
    if (wav.samples.empty())
        throw AudioInputError("Waveform contains no samples");
}

Waveform read_audio(const fs::path& path) {
    if (!fs::exists(path))
        throw AudioInputError("Audio file not found: " + path.string());

    SF_INFO info = {};
    SoundFile sf(path, SFM_READ, info);
    if (!sf)
        throw AudioInputError("Failed to open audio: " + path.string() +
                              " (" + sf_strerror(nullptr) + ")");

    // libsndfile converts any subtype to float
    std::vector<float> interleaved(static_cast<size_t>(info.frames) * info.channels);
    sf_count_t frames = sf_readf_float(sf.get(), interleaved.data(), info.frames);
    if (frames <= 0)
        throw AudioInputError("Audio file contains no data: " + path.string());

    Waveform wav;
    wav.sample_rate = info.samplerate;

    if (info.channels > 1) {
        wav.samples.resize(frames);
        for (sf_count_t i = 0; i < frames; ++i) {
            float sum = 0;
            for (int ch = 0; ch < info.channels; ++ch)
                sum += interleaved[i * info.channels + ch];
            wav.samples[i] = sum / info.channels;
        }
    } else {
        interleaved.resize(frames);
        wav.samples = std::move(interleaved);
    }

    log_info("Audio loaded: %s, %.2fs, %dHz, %d channel(s)",
             path.filename().c_str(), wav.duration(), wav.sample_rate, info.channels);
    return wav;
}

AudioInfo get_audio_info(const fs::path& path) {
    if (!fs::exists(path) || fs::file_size(path) == 0)
        throw AudioInputError("Audio file is missing or empty: " + path.string());

    SF_INFO info = {};
    SoundFile sf(path, SFM_READ, info);
    if (!sf)
        throw AudioInputError("Failed to open audio: " + path.string() +
                              " (" + sf_strerror(nullptr) + ")");

    AudioInfo out;
    out.sample_rate = info.samplerate;
    out.channels = info.channels;
    out.frames = static_cast<int64_t>(info.frames);
    out.duration_sec = info.samplerate > 0
        ? static_cast<double>(info.frames) / info.samplerate : 0.0;
    out.codec = codec_name(info.format);
    return out;
}

void write_wav(const fs::path& path, const std::vector<float>& samples, int sample_rate) {
    SF_INFO info = {};
    info.samplerate = sample_rate;
    info.channels = 1;
    info.format = SF_FORMAT_WAV | SF_FORMAT_PCM_16;

    SoundFile sf(path, SFM_WRITE, info);
    if (!sf)
        throw SonixError("Failed to open WAV for writing: " + path.string() +
                         " (" + sf_strerror(nullptr) + ")");

    sf_count_t written = sf_write_float(sf.get(), samples.data(),
                                        static_cast<sf_count_t>(samples.size()));
    if (written != static_cast<sf_count_t>(samples.size()))
        throw SonixError("WAV write incomplete: " + path.string());
}

} // namespace sonix

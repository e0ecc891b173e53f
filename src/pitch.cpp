// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "pitch.h"
#include "log.h"

#include <algorithm>
#include <cmath>

namespace sonix {

namespace {

constexpr double SILENT_POWER = 1e-10;

// Integer box-average decimation toward MODEL_SAMPLE_RATE. Returns the new rate.
double decimate(const std::vector<float>& in, int sample_rate, std::vector<float>& out) {
    int factor = std::max(1, sample_rate / MODEL_SAMPLE_RATE);
    if (factor == 1) {
        out = in;
        return sample_rate;
    }
    out.reserve(in.size() / factor);
    for (size_t i = 0; i + factor <= in.size(); i += factor) {
        double sum = 0.0;
        for (int k = 0; k < factor; ++k)
            sum += in[i + k];
        out.push_back(static_cast<float>(sum / factor));
    }
    return static_cast<double>(sample_rate) / factor;
}

// YIN on one frame: difference function, cumulative mean normalization,
// first dip below threshold refined to its local minimum and interpolated.
double frame_f0(const float* x, int window, int min_lag, int max_lag,
                double threshold, double rate, std::vector<double>& cmnd) {
    double power = 0.0;
    for (int j = 0; j < window; ++j)
        power += static_cast<double>(x[j]) * x[j];
    if (power / window <= SILENT_POWER)
        return 0.0;

    cmnd.assign(max_lag + 2, 1.0);
    double running = 0.0;
    for (int lag = 1; lag <= max_lag + 1; ++lag) {
        double d = 0.0;
        for (int j = 0; j < window; ++j) {
            double diff = static_cast<double>(x[j]) - x[j + lag];
            d += diff * diff;
        }
        running += d;
        cmnd[lag] = running > 0.0 ? d * lag / running : 1.0;
    }

    int lag = min_lag;
    while (lag <= max_lag && cmnd[lag] >= threshold)
        ++lag;
    if (lag > max_lag)
        return 0.0;
    while (lag < max_lag && cmnd[lag + 1] < cmnd[lag])
        ++lag;

    double refined = lag;
    double a = cmnd[lag - 1], b = cmnd[lag], c = cmnd[lag + 1];
    double denom = a - 2.0 * b + c;
    if (denom > 0.0)
        refined += 0.5 * (a - c) / denom;
    return rate / refined;
}

} // anonymous namespace

std::vector<double> track_pitch(const Waveform& wav, const PitchConfig& config) {
    if (config.frame_length < 4 || config.hop_length <= 0)
        throw SonixError("Pitch frame and hop length must be positive");
    if (config.fmin <= 0.0 || config.fmax <= config.fmin)
        throw SonixError("Pitch range must satisfy 0 < fmin < fmax");
    validate_waveform(wav);

    std::vector<float> x;
    double rate = decimate(wav.samples, wav.sample_rate, x);

    const int window = config.frame_length / 2;
    const int min_lag = std::max(2, static_cast<int>(std::floor(rate / config.fmax)));
    const int max_lag = std::min(static_cast<int>(std::ceil(rate / config.fmin)),
                                 config.frame_length - window - 2);

    std::vector<double> f0;
    if (min_lag >= max_lag) {
        log_warn("Pitch: no usable lag range at %.0f Hz", rate);
        return f0;
    }

    std::vector<double> cmnd;
    for (size_t start = 0; start + config.frame_length <= x.size(); start += config.hop_length) {
        double hz = frame_f0(x.data() + start, window, min_lag, max_lag,
                             config.threshold, rate, cmnd);
        if (hz < config.fmin || hz > config.fmax)
            hz = 0.0;
        f0.push_back(hz);
    }
    return f0;
}

PitchStats pitch_stats(const Waveform& wav, const PitchConfig& config) {
    std::vector<double> voiced;
    for (double hz : track_pitch(wav, config))
        if (hz > 0.0) voiced.push_back(hz);

    PitchStats stats;
    stats.voiced_frames = static_cast<int>(voiced.size());
    if (voiced.empty()) {
        log_info("Pitch: no voiced frames");
        return stats;
    }

    double sum = 0.0;
    for (double hz : voiced) sum += hz;
    stats.mean_hz = sum / voiced.size();

    if (voiced.size() > 1) {
        double var = 0.0;
        for (double hz : voiced)
            var += (hz - stats.mean_hz) * (hz - stats.mean_hz);
        stats.variability_hz = std::sqrt(var / voiced.size());
    }

    log_info("Pitch: %d voiced frame(s), mean %.2f Hz", stats.voiced_frames, stats.mean_hz);
    return stats;
}

} // namespace sonix

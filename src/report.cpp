// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "report.h"

#include <cstdio>
#include <sstream>

namespace sonix {

std::string json_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 16);
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    return out;
}

namespace {

std::string fixed(double value, int decimals) {
    char buf[64];
    snprintf(buf, sizeof(buf), "%.*f", decimals, value);
    return buf;
}

void write_segments(std::ostringstream& out, const std::vector<Segment>& segments,
                    const std::string& indent) {
    if (segments.empty()) {
        out << "[]";
        return;
    }
    out << "[\n";
    for (size_t i = 0; i < segments.size(); ++i) {
        const auto& s = segments[i];
        out << indent << "  {\n"
            << indent << "    \"start_time_sec\": " << fixed(s.start_time_sec, 4) << ",\n"
            << indent << "    \"end_time_sec\": " << fixed(s.end_time_sec, 4) << ",\n"
            << indent << "    \"label\": \"" << json_escape(s.label) << "\",\n"
            << indent << "    \"transcript\": \"" << json_escape(s.transcript) << "\"\n"
            << indent << "  }" << (i + 1 < segments.size() ? "," : "") << "\n";
    }
    out << indent << "]";
}

} // anonymous namespace

std::string segments_to_json(const std::vector<Segment>& segments) {
    std::ostringstream out;
    out << "{\n  \"segments\": ";
    write_segments(out, segments, "  ");
    out << "\n}\n";
    return out.str();
}

std::string analysis_to_json(const AudioAnalysis& a) {
    const auto& info = a.audio_info;
    std::ostringstream out;
    out << "{\n"
        << "  \"audio_info\": {\n"
        << "    \"duration_sec\": " << fixed(info.duration_sec, 2) << ",\n"
        << "    \"sample_rate\": " << info.sample_rate << ",\n"
        << "    \"channels\": " << info.channels << ",\n"
        << "    \"frames\": " << info.frames << ",\n"
        << "    \"codec\": \"" << json_escape(info.codec) << "\"\n"
        << "  },\n"
        << "  \"speech_segments\": " << a.speech_segments << ",\n"
        << "  \"average_pitch_hz\": " << fixed(a.pitch.mean_hz, 2) << ",\n"
        << "  \"pitch_variance\": " << fixed(a.pitch.variability_hz, 2) << ",\n"
        << "  \"mean_energy_db\": " << fixed(a.energy.mean_db, 2) << ",\n"
        << "  \"energy_variability_db\": " << fixed(a.energy.variability_db, 2) << ",\n"
        << "  \"speech_rate_wpm\": "
        << (a.speech_rate_wpm ? std::to_string(*a.speech_rate_wpm) : "null") << ",\n"
        << "  \"segments\": ";
    write_segments(out, a.segments, "  ");
    out << "\n}\n";
    return out.str();
}

} // namespace sonix

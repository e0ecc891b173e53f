// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "analysis.h"
#include "segment.h"

#include <string>
#include <vector>

namespace sonix {

/// Escape a string for embedding in a JSON string literal.
std::string json_escape(const std::string& s);

/// {"segments": [...]} with times at four decimals.
std::string segments_to_json(const std::vector<Segment>& segments);

/// Full analysis document, scalar features rounded to two decimals.
/// speech_rate_wpm is null when no transcription ran.
std::string analysis_to_json(const AudioAnalysis& analysis);

} // namespace sonix

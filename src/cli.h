// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "config.h"

namespace sonix {

struct CliResult {
    Config cfg;
    fs::path input_path;    // positional audio file
    fs::path output_path;   // empty = stdout
    bool segments_only = false;
    bool list_segments = false;
    bool show_help = false;
    bool show_version = false;
};

/// Parse command-line arguments. Loads config file as defaults, then applies flag overrides.
/// config_path: config file to load (empty = ~/.config/sonix/config.yaml).
CliResult parse_cli(int argc, char* argv[], const fs::path& config_path = {});

} // namespace sonix

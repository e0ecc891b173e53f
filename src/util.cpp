// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "util.h"

#include <cstdlib>
#include <fstream>
#include <thread>

namespace sonix {

static fs::path xdg_dir(const char* env_var, const char* fallback_suffix) {
    if (const char* val = std::getenv(env_var); val && val[0] != '\0')
        return fs::path(val) / "sonix";
    if (const char* home = std::getenv("HOME"))
        return fs::path(home) / fallback_suffix / "sonix";
    return fs::path(".") / fallback_suffix / "sonix";
}

fs::path config_dir() { return xdg_dir("XDG_CONFIG_HOME", ".config"); }
fs::path data_dir()   { return xdg_dir("XDG_DATA_HOME", ".local/share"); }
fs::path models_dir() { return data_dir() / "models"; }

void write_text_file(const fs::path& path, const std::string& content) {
    if (path.has_parent_path())
        fs::create_directories(path.parent_path());

    std::ofstream out(path, std::ios::binary);
    if (!out)
        throw SonixError("Cannot write file: " + path.string());
    out << content;
    if (!out)
        throw SonixError("Write failed: " + path.string());
}

int default_thread_count() {
    unsigned n = std::thread::hardware_concurrency();
    return (n > 1) ? static_cast<int>(n - 1) : 1;
}

} // namespace sonix

// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "log.h"
#include "util.h"

#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>

namespace sonix {

namespace {

LogLevel g_level = LogLevel::NONE;
FILE* g_file = nullptr;
fs::path g_path;
std::mutex g_mutex;

std::tm local_now() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&time_t, &tm);
    return tm;
}

void write_log(LogLevel level, const char* fmt, va_list args) {
    if (g_level < level) return;

    std::lock_guard<std::mutex> lock(g_mutex);
    if (!g_file) return;

    std::tm tm = local_now();
    fprintf(g_file, "%04d-%02d-%02d %02d:%02d:%02d [%s] ",
            tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
            tm.tm_hour, tm.tm_min, tm.tm_sec, log_level_name(level));
    vfprintf(g_file, fmt, args);
    fprintf(g_file, "\n");
    fflush(g_file);
}

} // anonymous namespace

LogLevel parse_log_level(const std::string& s) {
    if (s == "info" || s == "INFO") return LogLevel::INFO;
    if (s == "warn" || s == "WARN") return LogLevel::WARN;
    if (s == "error" || s == "ERROR") return LogLevel::ERROR;
    return LogLevel::NONE;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default:              return "NONE";
    }
}

void log_init(LogLevel level, const fs::path& dir) {
    log_shutdown();
    if (level == LogLevel::NONE) return;

    fs::path log_dir = dir.empty() ? (data_dir() / "logs") : dir;
    fs::create_directories(log_dir);

    // One file per day, appended across runs
    std::tm tm = local_now();
    char datebuf[16];
    strftime(datebuf, sizeof(datebuf), "%Y-%m-%d", &tm);

    std::lock_guard<std::mutex> lock(g_mutex);
    g_path = log_dir / ("sonix-" + std::string(datebuf) + ".log");
    g_file = fopen(g_path.c_str(), "a");
    if (!g_file) {
        g_path.clear();
        return;
    }
    g_level = level;
}

fs::path log_file_path() {
    std::lock_guard<std::mutex> lock(g_mutex);
    return g_path;
}

void log_shutdown() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_file) {
        fclose(g_file);
        g_file = nullptr;
    }
    g_path.clear();
    g_level = LogLevel::NONE;
}

void log_info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_log(LogLevel::INFO, fmt, args);
    va_end(args);
}

void log_warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_log(LogLevel::WARN, fmt, args);
    va_end(args);
}

void log_error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_log(LogLevel::ERROR, fmt, args);
    va_end(args);
}

} // namespace sonix

/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include <multimcp/logging/fmt_logger.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>

#include <fmt/core.h>

namespace multimcp::logging {

std::optional<Level> parse_level(std::string_view name) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG") return Level::Debug;
    if (upper == "INFO") return Level::Info;
    if (upper == "WARNING" || upper == "WARN") return Level::Warning;
    if (upper == "ERROR") return Level::Error;
    if (upper == "CRITICAL") return Level::Critical;
    return std::nullopt;
}

std::string_view level_name(Level level) {
    switch (level) {
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warning: return "WARNING";
        case Level::Error: return "ERROR";
        case Level::Critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

static std::string now_hms() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    return fmt::format("[{:02d}:{:02d}:{:02d}]", tm.tm_hour, tm.tm_min, tm.tm_sec);
}

static void print_line(std::FILE* out, std::string_view level, std::string_view msg) {
    fmt::print(out, "{} [{}] {}\n", now_hms(), level, msg);
    std::fflush(out);
}

void FmtLogger::info(std::string_view msg) {
    if (enabled(Level::Info)) print_line(out_, "INFO", msg);
}

void FmtLogger::warn(std::string_view msg) {
    if (enabled(Level::Warning)) print_line(out_, "WARN", msg);
}

void FmtLogger::error(std::string_view msg) {
    if (enabled(Level::Error)) print_line(err_, "ERROR", msg);
}

void FmtLogger::debug(std::string_view msg) {
    if (enabled(Level::Debug)) print_line(out_, "DEBUG", msg);
}

void FmtLogger::critical(std::string_view msg) {
    print_line(err_, "CRITICAL", msg);
}

} // namespace multimcp::logging

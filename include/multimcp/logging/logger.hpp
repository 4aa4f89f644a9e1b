/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace multimcp::logging {

// Ordered by severity; a logger drops everything below its threshold.
enum class Level {
    Debug = 0,
    Info,
    Warning,
    Error,
    Critical,
};

// Accepts the deployment spellings (DEBUG, INFO, WARNING, ERROR, CRITICAL), case-insensitive.
std::optional<Level> parse_level(std::string_view name);
std::string_view level_name(Level level);

class Logger {
public:
    virtual ~Logger() = default;
    virtual void info(std::string_view msg) = 0;
    virtual void warn(std::string_view msg) = 0;
    virtual void error(std::string_view msg) = 0;
    virtual void debug(std::string_view msg) = 0;
};

} // namespace multimcp::logging

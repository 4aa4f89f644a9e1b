/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <multimcp/logging/logger.hpp>

#include <atomic>
#include <cstdio>

namespace multimcp::logging {

// Writes "[HH:MM:SS] [LEVEL] msg" lines through fmt. Errors go to stderr, the rest to stdout.
class FmtLogger : public Logger {
public:
    explicit FmtLogger(Level threshold = Level::Info, std::FILE* out = stdout, std::FILE* err = stderr)
        : threshold_(threshold), out_(out), err_(err) {}
    void info(std::string_view msg) override;
    void warn(std::string_view msg) override;
    void error(std::string_view msg) override;
    void debug(std::string_view msg) override;
    void critical(std::string_view msg);

    void set_threshold(Level level) { threshold_.store(level); }
    Level threshold() const { return threshold_.load(); }

private:
    bool enabled(Level level) const { return level >= threshold_.load(); }

    std::atomic<Level> threshold_{Level::Info};
    std::FILE* out_;
    std::FILE* err_;
};

} // namespace multimcp::logging

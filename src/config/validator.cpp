/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include <multimcp/config/validator.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>

#include <fmt/format.h>

#include <multimcp/logging/logger.hpp>

namespace multimcp::config {

bool is_valid_hostname(const std::string& host, std::string& err) {
    if (host.empty()) { err = "hostname is empty"; return false; }
    if (host.size() > 253) { err = "hostname too long (>253)"; return false; }
    std::size_t start = 0;
    while (start < host.size()) {
        auto dot = host.find('.', start);
        std::size_t end = (dot == std::string::npos) ? host.size() : dot;
        std::size_t len = end - start;
        if (len == 0) { err = "empty hostname label"; return false; }
        if (len > 63) { err = "hostname label too long (>63)"; return false; }
        if (host[start] == '-' || host[end-1] == '-') { err = "hostname label cannot start or end with '-'"; return false; }
        for (std::size_t i = start; i < end; ++i) {
            char c = host[i];
            if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '-')) {
                err = "hostname contains invalid characters"; return false; }
        }
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return true;
}

bool is_valid_port(int port, std::string& err) {
    if (port < 1 || port > 65535) { err = fmt::format("port {} out of range (1-65535)", port); return false; }
    return true;
}

std::vector<std::string> validate_run_options(const RunOptions& opts) {
    std::vector<std::string> errs;
    if (opts.config_path.empty()) errs.push_back("config path is required");
    if (opts.transport != "stdio" && opts.transport != "sse") {
        errs.push_back(fmt::format("transport must be 'stdio' or 'sse', got '{}'", opts.transport));
    }
    std::string e;
    if (!is_valid_hostname(opts.host, e)) errs.push_back(fmt::format("host '{}': {}", opts.host, e));
    if (!is_valid_port(opts.port, e)) errs.push_back(e);
    if (!logging::parse_level(opts.log_level)) {
        errs.push_back(fmt::format("log level must be one of DEBUG, INFO, WARNING, ERROR, CRITICAL, got '{}'",
                                   opts.log_level));
    }
    return errs;
}

std::vector<std::string> apply_env_overrides(RunOptions& opts) {
    std::vector<std::string> errs;
    if (const char* v = std::getenv("MULTIMCP_CONFIG"))    opts.config_path = v;
    if (const char* v = std::getenv("MULTIMCP_TRANSPORT")) opts.transport = v;
    if (const char* v = std::getenv("MULTIMCP_HOST"))      opts.host = v;
    if (const char* v = std::getenv("MULTIMCP_LOG_LEVEL")) opts.log_level = v;
    if (const char* v = std::getenv("MULTIMCP_PORT")) {
        const std::string s(v);
        if (s.empty() || !std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; }) || s.size() > 5) {
            errs.push_back(fmt::format("MULTIMCP_PORT must contain only digits, got '{}'", s));
        } else {
            opts.port = std::stoi(s);
        }
    }
    return errs;
}

} // namespace multimcp::config

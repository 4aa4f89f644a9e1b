/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <string>
#include <vector>

#include <multimcp/config/types.hpp>

namespace multimcp::config {

// Validates hostname (RFC-ish light rules) and returns error in 'err' if invalid.
bool is_valid_hostname(const std::string& host, std::string& err);

// Port must be in [1..65535].
bool is_valid_port(int port, std::string& err);

// Checks transport, host, port and log level. Returns every problem found (empty if ok).
std::vector<std::string> validate_run_options(const RunOptions& opts);

// Apply MULTIMCP_* environment variables (CONFIG, TRANSPORT, HOST, PORT, LOG_LEVEL) on top of opts.
// Returns errors for values that cannot be applied (e.g. a non-numeric port).
std::vector<std::string> apply_env_overrides(RunOptions& opts);

} // namespace multimcp::config

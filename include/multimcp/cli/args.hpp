/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <multimcp/config/types.hpp>
#include <multimcp/logging/logger.hpp>

namespace multimcp::cli {

// Parse CLI using cxxopts. Precedence: built-in defaults, then MULTIMCP_* environment, then flags.
// Writes help/version and argument errors through the provided logger.
multimcp::config::ParseResult parse(int argc, char** argv, multimcp::logging::Logger& log);

} // namespace multimcp::cli

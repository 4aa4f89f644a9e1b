/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <multimcp/config/errors.hpp>
#include <multimcp/logging/logger.hpp>

namespace multimcp::cli {

enum ExitCode : int {
    kExitOk = 0,
    kExitUsage = 1,
    kExitNotFound = 2,
    kExitRead = 3,
    kExitParse = 4,
    kExitValidation = 5,
};

ExitCode exit_code_for(multimcp::config::ErrorKind kind);

// Logs the error and a hint for fixing it, both at error level so they survive any threshold
// that still shows errors. Returns the process exit code for the error's kind.
ExitCode report(const multimcp::config::ConfigError& e, multimcp::logging::Logger& log);

} // namespace multimcp::cli

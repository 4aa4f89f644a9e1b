/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include <multimcp/cli/report.hpp>

#include <fmt/core.h>

#include <multimcp/config/types.hpp>

using multimcp::config::ErrorKind;

namespace multimcp::cli {

ExitCode exit_code_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound: return kExitNotFound;
        case ErrorKind::Read: return kExitRead;
        case ErrorKind::Parse: return kExitParse;
        case ErrorKind::Validation: return kExitValidation;
    }
    return kExitUsage;
}

ExitCode report(const multimcp::config::ConfigError& e, multimcp::logging::Logger& log) {
    log.error(e.what());
    switch (e.kind()) {
        case ErrorKind::NotFound:
            log.error(fmt::format("Pass an absolute path with --config, or place the file in ~/ or ~/.config/{}/",
                                  multimcp::config::kAppName));
            break;
        case ErrorKind::Read:
            log.error("The file exists but could not be read; check its permissions.");
            break;
        case ErrorKind::Parse:
            log.error("Fix the JSON syntax at the reported position and try again.");
            break;
        case ErrorKind::Validation:
            log.error(fmt::format("Expected a document of the form {{\"{}\": {{\"<name>\": {{\"command\": ..., \"args\": [...]}}}}}}",
                                  multimcp::config::kServersKey));
            break;
    }
    return exit_code_for(e.kind());
}

} // namespace multimcp::cli

/*
 * multi-mcp bootstrap
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#include <exception>
#include <string>

#include <fmt/core.h>

#include <multimcp/cli/args.hpp>
#include <multimcp/cli/report.hpp>
#include <multimcp/config/errors.hpp>
#include <multimcp/config/loader.hpp>
#include <multimcp/config/servers.hpp>
#include <multimcp/logging/fmt_logger.hpp>

#ifndef MULTIMCP_VERSION
#define MULTIMCP_VERSION "0.0.0"
#endif

using multimcp::config::ConfigError;
using namespace multimcp::cli;

int main(int argc, char** argv) {
    multimcp::logging::FmtLogger log;

    auto parsed = multimcp::cli::parse(argc, argv, log);
    if (parsed.show_only) {
        return kExitOk;
    }
    if (!parsed.opts.has_value()) {
        return kExitUsage;
    }
    const auto& opts = *parsed.opts;
    log.set_threshold(multimcp::logging::parse_level(opts.log_level).value_or(multimcp::logging::Level::Info));

    try {
        const auto cfg = multimcp::config::load_mcp_config(opts.config_path, log);
        const auto servers = multimcp::config::server_descriptors(cfg);

        if (parsed.check_only) {
            fmt::print("{} ({} server(s))\n", cfg.source.string(), servers.size());
            for (const auto& s : servers) fmt::print("  {}\n", multimcp::config::describe(s));
            return kExitOk;
        }

        log.info(fmt::format("multi-mcp v{}", MULTIMCP_VERSION));
        log.info(fmt::format("  config    : {}", cfg.source.string()));
        log.info(fmt::format("  transport : {}", opts.transport));
        if (opts.transport == "sse") {
            log.info(fmt::format("  listen    : {}:{}", opts.host, opts.port));
        }
        for (const auto& s : servers) {
            log.info(fmt::format("  server    : {}", multimcp::config::describe(s)));
        }
        log.warn("(bootstrap mode: server launch and transports are provided by the launcher)");
    } catch (const ConfigError& e) {
        return report(e, log);
    } catch (const std::exception& e) {
        log.critical(fmt::format("unexpected failure: {}", e.what()));
        return kExitUsage;
    }

    return kExitOk;
}

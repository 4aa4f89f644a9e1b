/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include <multimcp/cli/args.hpp>

#include <string>

#include <cxxopts.hpp>
#include <fmt/core.h>

#include <multimcp/config/validator.hpp>

#ifndef MULTIMCP_VERSION
#define MULTIMCP_VERSION "0.0.0"
#endif

namespace multimcp::cli {

multimcp::config::ParseResult parse(int argc, char** argv, multimcp::logging::Logger& log) {
    multimcp::config::ParseResult pr;
    cxxopts::Options options("multi-mcp", "Launches the MCP servers listed in a JSON configuration");
    // clang-format off
    options.add_options()
        ("config",    "Path to the MCP servers file (default: mcp.json)", cxxopts::value<std::string>())
        ("transport", "Transport exposed to clients: stdio | sse (default: sse)", cxxopts::value<std::string>())
        ("host",      "Host to bind for sse (default: 127.0.0.1)", cxxopts::value<std::string>())
        ("port",      "Port to bind for sse (default: 8080)", cxxopts::value<int>())
        ("log-level", "DEBUG | INFO | WARNING | ERROR | CRITICAL (default: INFO)", cxxopts::value<std::string>())
        ("d,debug",   "Shorthand for --log-level DEBUG")
        ("check",     "Resolve and load the configuration, print the server list and exit")
        ("v,version", "Show version and exit")
        ("h,help",    "Show help and exit");
    // clang-format on
    try {
        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            log.info(options.help());
            pr.show_only = true;
            return pr;
        }
        if (result.count("version")) {
            log.info(fmt::format("multi-mcp v{}", MULTIMCP_VERSION));
            pr.show_only = true;
            return pr;
        }

        multimcp::config::RunOptions opts;
        auto errs = multimcp::config::apply_env_overrides(opts);

        if (result.count("config"))    opts.config_path = result["config"].as<std::string>();
        if (result.count("transport")) opts.transport = result["transport"].as<std::string>();
        if (result.count("host"))      opts.host = result["host"].as<std::string>();
        if (result.count("port"))      opts.port = result["port"].as<int>();
        if (result.count("log-level")) opts.log_level = result["log-level"].as<std::string>();
        if (result.count("debug"))     opts.log_level = "DEBUG";
        pr.check_only = result.count("check") > 0;

        for (const auto& e : multimcp::config::validate_run_options(opts)) errs.push_back(e);
        if (!errs.empty()) {
            for (const auto& e : errs) log.error(e);
            log.error(fmt::format("Invalid options.\n\n{}", options.help()));
            return pr;
        }
        pr.opts = opts;
    } catch (const std::exception& e) {
        log.error(fmt::format("Argument error: {}\n\n{}", e.what(), options.help()));
        return pr;
    }
    return pr;
}

} // namespace multimcp::cli

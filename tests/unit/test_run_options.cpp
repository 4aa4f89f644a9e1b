/*
 * Unit tests for run options (hostname, port, env overrides, CLI)
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cstdlib>
#include <string>
#include <vector>

#include <multimcp/cli/args.hpp>
#include <multimcp/config/validator.hpp>
#include <multimcp/logging/logger.hpp>

#include "../fakes/recording_logger.hpp"

using namespace multimcp::config;

namespace {

const char* const kEnvVars[] = {
    "MULTIMCP_CONFIG", "MULTIMCP_TRANSPORT", "MULTIMCP_HOST", "MULTIMCP_PORT", "MULTIMCP_LOG_LEVEL",
};

// Clears MULTIMCP_* on entry and exit so cases do not leak into each other.
struct CleanEnv {
    CleanEnv() { clear(); }
    ~CleanEnv() { clear(); }
    static void clear() {
        for (const char* name : kEnvVars) ::unsetenv(name);
    }
};

ParseResult run_cli(std::vector<std::string> args, multimcp::logging::Logger& log) {
    args.insert(args.begin(), "multi-mcp");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);
    return multimcp::cli::parse(static_cast<int>(args.size()), argv.data(), log);
}

} // namespace

TEST_SUITE("Run Options") {
    TEST_CASE("is_valid_hostname - valid hostnames") {
        std::string err;

        CHECK(is_valid_hostname("localhost", err));
        CHECK(is_valid_hostname("127.0.0.1", err));
        CHECK(is_valid_hostname("0.0.0.0", err));
        CHECK(is_valid_hostname("mcp.example.com", err));
        CHECK(is_valid_hostname("a1-b2.c3-d4.example.org", err));
    }

    TEST_CASE("is_valid_hostname - invalid hostnames") {
        std::string err;

        CHECK_FALSE(is_valid_hostname("", err));
        CHECK(err.find("empty") != std::string::npos);

        CHECK_FALSE(is_valid_hostname("-start.com", err));
        CHECK(err.find("'-'") != std::string::npos);

        CHECK_FALSE(is_valid_hostname("under_score.com", err));
        CHECK(err.find("invalid characters") != std::string::npos);

        CHECK_FALSE(is_valid_hostname("example..com", err));
        CHECK(err.find("empty hostname label") != std::string::npos);

        std::string long_host(254, 'a');
        CHECK_FALSE(is_valid_hostname(long_host, err));
        CHECK(err.find("too long") != std::string::npos);
    }

    TEST_CASE("is_valid_port - range") {
        std::string err;
        CHECK(is_valid_port(1, err));
        CHECK(is_valid_port(8080, err));
        CHECK(is_valid_port(65535, err));
        CHECK_FALSE(is_valid_port(0, err));
        CHECK(err.find("out of range") != std::string::npos);
        CHECK_FALSE(is_valid_port(65536, err));
        CHECK_FALSE(is_valid_port(-1, err));
    }

    TEST_CASE("validate_run_options - defaults are valid") {
        CHECK(validate_run_options(RunOptions{}).empty());
    }

    TEST_CASE("validate_run_options - collects every problem") {
        RunOptions opts;
        opts.config_path.clear();
        opts.transport = "websocket";
        opts.host = "bad host";
        opts.port = 0;
        opts.log_level = "LOUD";

        auto errs = validate_run_options(opts);
        CHECK(errs.size() == 5);
    }

    TEST_CASE("validate_run_options - log level is case-insensitive") {
        RunOptions opts;
        opts.log_level = "warning";
        CHECK(validate_run_options(opts).empty());
        opts.log_level = "Critical";
        CHECK(validate_run_options(opts).empty());
    }

    TEST_CASE("apply_env_overrides - values replace defaults") {
        CleanEnv env;
        ::setenv("MULTIMCP_CONFIG", "~/.config/multi-mcp/mcp.json", 1);
        ::setenv("MULTIMCP_TRANSPORT", "stdio", 1);
        ::setenv("MULTIMCP_HOST", "0.0.0.0", 1);
        ::setenv("MULTIMCP_PORT", "9090", 1);
        ::setenv("MULTIMCP_LOG_LEVEL", "DEBUG", 1);

        RunOptions opts;
        CHECK(apply_env_overrides(opts).empty());
        CHECK(opts.config_path == "~/.config/multi-mcp/mcp.json");
        CHECK(opts.transport == "stdio");
        CHECK(opts.host == "0.0.0.0");
        CHECK(opts.port == 9090);
        CHECK(opts.log_level == "DEBUG");
    }

    TEST_CASE("apply_env_overrides - bad port is reported, not applied") {
        CleanEnv env;
        ::setenv("MULTIMCP_PORT", "80a", 1);

        RunOptions opts;
        auto errs = apply_env_overrides(opts);
        REQUIRE(errs.size() == 1);
        CHECK(errs[0].find("MULTIMCP_PORT") != std::string::npos);
        CHECK(opts.port == 8080);
    }

    TEST_CASE("apply_env_overrides - non-ASCII port bytes are rejected") {
        CleanEnv env;
        ::setenv("MULTIMCP_PORT", "80\xC3\xA9", 1);

        RunOptions opts;
        auto errs = apply_env_overrides(opts);
        REQUIRE(errs.size() == 1);
        CHECK(errs[0].find("only digits") != std::string::npos);
        CHECK(opts.port == 8080);
    }

    TEST_CASE("cli - defaults") {
        CleanEnv env;
        multimcp::test::RecordingLogger log;
        auto pr = run_cli({}, log);

        REQUIRE(pr.opts.has_value());
        CHECK_FALSE(pr.show_only);
        CHECK_FALSE(pr.check_only);
        CHECK(pr.opts->config_path == "mcp.json");
        CHECK(pr.opts->transport == "sse");
        CHECK(pr.opts->host == "127.0.0.1");
        CHECK(pr.opts->port == 8080);
        CHECK(pr.opts->log_level == "INFO");
    }

    TEST_CASE("cli - flags") {
        CleanEnv env;
        multimcp::test::RecordingLogger log;
        auto pr = run_cli({"--config", "./servers.json", "--transport", "stdio", "--port", "7000", "--check", "-d"}, log);

        REQUIRE(pr.opts.has_value());
        CHECK(pr.check_only);
        CHECK(pr.opts->config_path == "./servers.json");
        CHECK(pr.opts->transport == "stdio");
        CHECK(pr.opts->port == 7000);
        CHECK(pr.opts->log_level == "DEBUG");
    }

    TEST_CASE("cli - flags win over environment") {
        CleanEnv env;
        ::setenv("MULTIMCP_CONFIG", "/etc/multi-mcp/mcp.json", 1);
        ::setenv("MULTIMCP_HOST", "0.0.0.0", 1);
        multimcp::test::RecordingLogger log;
        auto pr = run_cli({"--config", "mine.json"}, log);

        REQUIRE(pr.opts.has_value());
        CHECK(pr.opts->config_path == "mine.json");
        CHECK(pr.opts->host == "0.0.0.0");
    }

    TEST_CASE("cli - help and version") {
        CleanEnv env;
        multimcp::test::RecordingLogger log;

        auto help = run_cli({"--help"}, log);
        CHECK(help.show_only);
        CHECK_FALSE(help.opts.has_value());
        CHECK(log.any_info_contains("--config"));

        auto version = run_cli({"-v"}, log);
        CHECK(version.show_only);
        CHECK(log.any_info_contains("multi-mcp v"));
    }

    TEST_CASE("cli - invalid values are rejected") {
        CleanEnv env;
        multimcp::test::RecordingLogger log;

        auto bad_transport = run_cli({"--transport", "http"}, log);
        CHECK_FALSE(bad_transport.opts.has_value());
        CHECK_FALSE(bad_transport.show_only);
        CHECK_FALSE(log.errors.empty());

        auto bad_port = run_cli({"--port", "notaport"}, log);
        CHECK_FALSE(bad_port.opts.has_value());

        auto unknown = run_cli({"--frobnicate"}, log);
        CHECK_FALSE(unknown.opts.has_value());
    }
}

/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace multimcp::config {

// Top-level key holding the server-name -> descriptor mapping.
inline constexpr const char* kServersKey = "mcpServers";

// Directory name under ~/.config used as the second fallback location.
inline constexpr const char* kAppName = "multi-mcp";

// A validated configuration document. servers is always a JSON object.
struct McpConfig {
    std::filesystem::path source;
    nlohmann::json document;
    nlohmann::json servers;
};

// Launch description of one backend server.
struct ServerDescriptor {
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::optional<std::string> url;
};

struct RunOptions {
    std::string config_path{"mcp.json"};
    std::string transport{"sse"};  // stdio | sse
    std::string host{"127.0.0.1"};
    int port{8080};
    std::string log_level{"INFO"};
};

struct ParseResult {
    std::optional<RunOptions> opts; // present when valid and ready to run
    bool show_only{false};          // true if --help/--version was printed
    bool check_only{false};         // true if --check: load, print inventory, exit
};

} // namespace multimcp::config

/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <multimcp/config/types.hpp>

namespace multimcp::config {

// Converts one mcpServers entry. An entry needs a "command" string or a "url" string;
// "args" (array of strings) and "env" (object of strings) are optional.
// Throws ValidationError naming mcpServers.<name>.<field>.
ServerDescriptor to_descriptor(const std::string& name, const nlohmann::json& entry,
                               const std::filesystem::path& origin);

// All entries of cfg.servers, ordered by name.
std::vector<ServerDescriptor> server_descriptors(const McpConfig& cfg);

// "name: command arg1 arg2" or "name: <url>" for remote servers.
std::string describe(const ServerDescriptor& server);

} // namespace multimcp::config

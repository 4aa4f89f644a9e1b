/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include <multimcp/config/path_resolver.hpp>
#include <multimcp/config/types.hpp>
#include <multimcp/logging/logger.hpp>

namespace multimcp::config {

struct LoadOptions {
    std::string section_key{kServersKey};
    bool reject_duplicate_keys{true};
};

// Reads, parses and shape-checks one configuration file. Holds no state between calls.
class ConfigLoader {
public:
    explicit ConfigLoader(logging::Logger& log, LoadOptions opts = {});

    // Throws ReadError, ParseError or ValidationError.
    McpConfig load(const std::filesystem::path& path) const;

    // Parses text that came from origin (used only in error messages). Throws ParseError.
    nlohmann::json parse(const std::string& text, const std::filesystem::path& origin) const;

    // Throws ValidationError unless document is an object whose section_key value is an object.
    void validate(const nlohmann::json& document, const std::filesystem::path& origin) const;

private:
    logging::Logger& log_;
    LoadOptions opts_;
};

// Whole file contents. Throws ReadError with the OS-reported cause.
std::string read_file(const std::filesystem::path& path);

// resolve() followed by load(); each call is independent and safe to retry.
McpConfig load_mcp_config(const std::string& raw_path, const PathResolver& resolver,
                          const ConfigLoader& loader);

// Same, using the process environment.
McpConfig load_mcp_config(const std::string& raw_path, logging::Logger& log);

} // namespace multimcp::config

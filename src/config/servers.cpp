/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include <multimcp/config/servers.hpp>

#include <fmt/format.h>

#include <multimcp/config/errors.hpp>

using json = nlohmann::json;

namespace multimcp::config {

static std::string field_key(const std::string& name, const char* field) {
    return fmt::format("{}.{}.{}", kServersKey, name, field);
}

ServerDescriptor to_descriptor(const std::string& name, const json& entry,
                               const std::filesystem::path& origin) {
    if (!entry.is_object()) {
        throw ValidationError(origin, fmt::format("{}.{}", kServersKey, name),
                              fmt::format("must be an object, got {}", entry.type_name()));
    }

    ServerDescriptor server;
    server.name = name;

    if (auto it = entry.find("command"); it != entry.end()) {
        if (!it->is_string()) throw ValidationError(origin, field_key(name, "command"), "must be a string");
        server.command = it->get<std::string>();
    }
    if (auto it = entry.find("url"); it != entry.end()) {
        if (!it->is_string()) throw ValidationError(origin, field_key(name, "url"), "must be a string");
        server.url = it->get<std::string>();
    }
    if (server.command.empty() && !server.url) {
        throw ValidationError(origin, field_key(name, "command"), "is missing (and no url given)");
    }

    if (auto it = entry.find("args"); it != entry.end()) {
        if (!it->is_array()) throw ValidationError(origin, field_key(name, "args"), "must be an array of strings");
        for (const auto& arg : *it) {
            if (!arg.is_string()) {
                throw ValidationError(origin, field_key(name, "args"), "must be an array of strings");
            }
            server.args.push_back(arg.get<std::string>());
        }
    }

    if (auto it = entry.find("env"); it != entry.end() && !it->is_null()) {
        if (!it->is_object()) throw ValidationError(origin, field_key(name, "env"), "must be an object of strings");
        for (const auto& [key, value] : it->items()) {
            if (!value.is_string()) {
                throw ValidationError(origin, fmt::format("{}.{}", field_key(name, "env"), key), "must be a string");
            }
            server.env[key] = value.get<std::string>();
        }
    }
    return server;
}

std::vector<ServerDescriptor> server_descriptors(const McpConfig& cfg) {
    std::vector<ServerDescriptor> out;
    out.reserve(cfg.servers.size());
    for (const auto& [name, entry] : cfg.servers.items()) {
        out.push_back(to_descriptor(name, entry, cfg.source));
    }
    return out;
}

std::string describe(const ServerDescriptor& server) {
    if (server.command.empty()) return fmt::format("{}: {}", server.name, server.url.value_or(""));
    std::string line = fmt::format("{}: {}", server.name, server.command);
    for (const auto& arg : server.args) line += fmt::format(" {}", arg);
    return line;
}

} // namespace multimcp::config

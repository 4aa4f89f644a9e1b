/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include <multimcp/config/loader.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <fstream>
#include <map>
#include <optional>
#include <set>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include <multimcp/config/errors.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace multimcp::config {

std::string read_file(const fs::path& path) {
    std::error_code ec;
    if (fs::is_directory(path, ec)) throw ReadError(path, "is a directory");

    errno = 0;
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        const int err = errno != 0 ? errno : ENOENT;
        throw ReadError(path, std::error_code(err, std::generic_category()).message());
    }

    std::string text;
    std::array<char, 4096> chunk{};
    errno = 0;
    while (in) {
        in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        text.append(chunk.data(), static_cast<std::size_t>(in.gcount()));
    }
    if (in.bad()) {
        const int err = errno;
        throw ReadError(path, err != 0 ? std::error_code(err, std::generic_category()).message()
                                       : std::string("I/O error while reading"));
    }
    return text;
}

// 1-based line and column of the byte at offset (nlohmann reports a 1-based byte count).
static std::pair<std::size_t, std::size_t> line_column(const std::string& text, std::size_t byte) {
    const std::size_t end = std::min(byte == 0 ? 0 : byte - 1, text.size());
    std::size_t line = 1;
    std::size_t line_start = 0;
    for (std::size_t i = 0; i < end; ++i) {
        if (text[i] == '\n') {
            ++line;
            line_start = i + 1;
        }
    }
    return {line, end - line_start + 1};
}

ConfigLoader::ConfigLoader(logging::Logger& log, LoadOptions opts)
    : log_(log), opts_(std::move(opts)) {}

// 0-based offset of the occurrence-th (1-based) object key spelled exactly `"key"`, or npos.
// Only called on text that already parsed, so strings are well formed.
static std::size_t locate_key(const std::string& text, const std::string& key, std::size_t occurrence) {
    std::size_t seen = 0;
    std::size_t i = 0;
    while (i < text.size()) {
        if (text[i] != '"') { ++i; continue; }
        const std::size_t open = i++;
        while (i < text.size() && text[i] != '"') i += (text[i] == '\\') ? 2 : 1;
        const std::size_t close = i++;
        std::size_t next = i;
        while (next < text.size() && std::isspace(static_cast<unsigned char>(text[next]))) ++next;
        if (next < text.size() && text[next] == ':' &&
            text.compare(open + 1, close - open - 1, key) == 0 && ++seen == occurrence) {
            return open;
        }
    }
    return std::string::npos;
}

namespace {

struct OpenContainer {
    bool is_object{false};
    std::string path;      // dotted location, empty for the root
    std::string last_key;  // most recent key, names the next nested container
    std::set<std::string> keys;
};

struct DuplicateKey {
    std::string key;
    std::string enclosing;
    std::size_t occurrence{0};
};

} // namespace

json ConfigLoader::parse(const std::string& text, const fs::path& origin) const {
    std::vector<OpenContainer> open;
    std::map<std::string, std::size_t> key_counts;
    std::optional<DuplicateKey> duplicate;

    auto child_path = [&]() -> std::string {
        if (open.empty()) return {};
        const auto& parent = open.back();
        if (!parent.is_object) return parent.path + "[]";
        return parent.path.empty() ? parent.last_key : fmt::format("{}.{}", parent.path, parent.last_key);
    };

    json::parser_callback_t track_keys = [&](int, json::parse_event_t event, json& parsed) {
        switch (event) {
            case json::parse_event_t::object_start:
                open.push_back(OpenContainer{true, child_path(), {}, {}});
                break;
            case json::parse_event_t::array_start:
                open.push_back(OpenContainer{false, child_path(), {}, {}});
                break;
            case json::parse_event_t::object_end:
            case json::parse_event_t::array_end:
                if (!open.empty()) open.pop_back();
                break;
            case json::parse_event_t::key: {
                if (open.empty()) break;
                auto key = parsed.get<std::string>();
                const std::size_t count = ++key_counts[key];
                auto& current = open.back();
                if (!duplicate && !current.keys.insert(key).second) {
                    duplicate = DuplicateKey{key, current.path, count};
                }
                current.last_key = std::move(key);
                break;
            }
            default:
                break;
        }
        return true;
    };

    json document;
    try {
        document = opts_.reject_duplicate_keys ? json::parse(text, track_keys) : json::parse(text);
    } catch (const json::parse_error& e) {
        const auto [line, column] = line_column(text, e.byte);
        throw ParseError(origin, e.what(), e.byte, line, column);
    } catch (const json::exception& e) {
        throw ParseError(origin, e.what());
    }

    if (duplicate) {
        const std::string detail = fmt::format("duplicate key '{}' in '{}'", duplicate->key,
                                               duplicate->enclosing.empty() ? "<root>" : duplicate->enclosing);
        const std::size_t offset = locate_key(text, duplicate->key, duplicate->occurrence);
        if (offset == std::string::npos) throw ParseError(origin, detail);
        const auto [line, column] = line_column(text, offset + 1);
        throw ParseError(origin, detail, offset + 1, line, column);
    }
    return document;
}

void ConfigLoader::validate(const json& document, const fs::path& origin) const {
    if (!document.is_object()) {
        throw ValidationError(origin, "<root>",
                              fmt::format("must be a JSON object, got {}", document.type_name()));
    }
    const auto it = document.find(opts_.section_key);
    if (it == document.end()) {
        throw ValidationError(origin, opts_.section_key, "is missing");
    }
    if (!it->is_object()) {
        throw ValidationError(origin, opts_.section_key,
                              fmt::format("must be an object, got {}", it->type_name()));
    }
}

McpConfig ConfigLoader::load(const fs::path& path) const {
    log_.debug(fmt::format("reading configuration {}", path.string()));
    const std::string text = read_file(path);

    McpConfig cfg;
    cfg.source = path;
    cfg.document = parse(text, path);
    validate(cfg.document, path);
    cfg.servers = cfg.document.at(opts_.section_key);

    log_.info(fmt::format("loaded {} server(s) from {}", cfg.servers.size(), path.string()));
    return cfg;
}

McpConfig load_mcp_config(const std::string& raw_path, const PathResolver& resolver,
                          const ConfigLoader& loader) {
    return loader.load(resolver.resolve(raw_path));
}

McpConfig load_mcp_config(const std::string& raw_path, logging::Logger& log) {
    const PathResolver resolver(log);
    const ConfigLoader loader(log);
    return load_mcp_config(raw_path, resolver, loader);
}

} // namespace multimcp::config

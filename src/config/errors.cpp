/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include <multimcp/config/errors.hpp>

#include <utility>

#include <fmt/format.h>

namespace multimcp::config {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound: return "not found";
        case ErrorKind::Read: return "read error";
        case ErrorKind::Parse: return "parse error";
        case ErrorKind::Validation: return "validation error";
    }
    return "unknown";
}

static std::string not_found_message(const std::string& raw_path,
                                     const std::vector<std::filesystem::path>& attempted) {
    if (attempted.empty()) {
        return fmt::format("configuration file not found: '{}' (no candidate paths)", raw_path);
    }
    std::string msg = fmt::format("configuration file not found: '{}'; tried:", raw_path);
    for (const auto& p : attempted) {
        msg += fmt::format("\n  {}", p.string());
    }
    return msg;
}

NotFoundError::NotFoundError(std::string raw_path, std::vector<std::filesystem::path> attempted)
    : ConfigError(ErrorKind::NotFound, not_found_message(raw_path, attempted)),
      raw_path_(std::move(raw_path)),
      attempted_(std::move(attempted)) {}

ReadError::ReadError(const std::filesystem::path& path, const std::string& cause)
    : ConfigError(ErrorKind::Read, fmt::format("cannot read {}: {}", path.string(), cause)),
      path_(path) {}

static std::string parse_message(const std::filesystem::path& path, const std::string& detail,
                                 std::size_t line, std::size_t column) {
    if (line == 0) return fmt::format("invalid JSON in {}: {}", path.string(), detail);
    return fmt::format("invalid JSON in {} at line {}, column {}: {}", path.string(), line, column, detail);
}

ParseError::ParseError(const std::filesystem::path& path, const std::string& detail,
                       std::size_t byte_offset, std::size_t line, std::size_t column)
    : ConfigError(ErrorKind::Parse, parse_message(path, detail, line, column)),
      path_(path),
      byte_offset_(byte_offset),
      line_(line),
      column_(column) {}

ValidationError::ValidationError(const std::filesystem::path& path, std::string key,
                                 const std::string& detail)
    : ConfigError(ErrorKind::Validation,
                  fmt::format("invalid configuration in {}: '{}' {}", path.string(), key, detail)),
      path_(path),
      key_(std::move(key)) {}

} // namespace multimcp::config

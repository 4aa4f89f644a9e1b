/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace multimcp::config {

enum class ErrorKind {
    NotFound,
    Read,
    Parse,
    Validation,
};

const char* error_kind_name(ErrorKind kind);

/**
 * Base of every failure raised while resolving or loading a configuration.
 *
 * Each attempt fails with exactly one kind; callers that need targeted
 * guidance switch on kind() or catch the derived type.
 */
class ConfigError : public std::runtime_error {
public:
    ConfigError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// None of the probed candidates exists as a regular file.
class NotFoundError : public ConfigError {
public:
    NotFoundError(std::string raw_path, std::vector<std::filesystem::path> attempted);

    const std::string& raw_path() const noexcept { return raw_path_; }
    const std::vector<std::filesystem::path>& attempted() const noexcept { return attempted_; }

private:
    std::string raw_path_;
    std::vector<std::filesystem::path> attempted_;
};

// The file exists but could not be opened or read.
class ReadError : public ConfigError {
public:
    ReadError(const std::filesystem::path& path, const std::string& cause);

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

// The content is not valid JSON. Line and column are 1-based; 0 when unknown.
class ParseError : public ConfigError {
public:
    ParseError(const std::filesystem::path& path, const std::string& detail,
               std::size_t byte_offset = 0, std::size_t line = 0, std::size_t column = 0);

    const std::filesystem::path& path() const noexcept { return path_; }
    std::size_t byte_offset() const noexcept { return byte_offset_; }
    std::size_t line() const noexcept { return line_; }
    std::size_t column() const noexcept { return column_; }

private:
    std::filesystem::path path_;
    std::size_t byte_offset_;
    std::size_t line_;
    std::size_t column_;
};

// Well-formed JSON with the wrong shape. key() is a dotted path such as "mcpServers.fs.command".
class ValidationError : public ConfigError {
public:
    ValidationError(const std::filesystem::path& path, std::string key, const std::string& detail);

    const std::filesystem::path& path() const noexcept { return path_; }
    const std::string& key() const noexcept { return key_; }

private:
    std::filesystem::path path_;
    std::string key_;
};

} // namespace multimcp::config

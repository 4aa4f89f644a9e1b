/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include <multimcp/logging/logger.hpp>

namespace multimcp::config {

// Answers "does this candidate exist as a regular file". Injected so tests can fake the filesystem.
using FileProbe = std::function<bool(const std::filesystem::path&)>;

// Answers "is this working directory a package-store location".
using StorePredicate = std::function<bool(const std::filesystem::path&)>;

// The two environment facts resolution depends on. home may be empty when unknown.
struct ResolveEnv {
    std::filesystem::path cwd;
    std::filesystem::path home;
};

// $HOME, falling back to the passwd entry of the current user. Empty if neither is available.
std::filesystem::path home_directory();

// Snapshot of the running process: current_path() and home_directory().
ResolveEnv current_env();

// "~" and "~/rest" become home and home/rest. "~user" and everything else are returned as-is.
std::filesystem::path expand_tilde(const std::string& raw, const std::filesystem::path& home);

// True when dir contains the consecutive components "nix", "store" (e.g. /nix/store/<hash>-pkg).
bool is_store_path(const std::filesystem::path& dir);

// Default probe. Never throws; unreadable or missing entries count as absent.
bool is_regular_file(const std::filesystem::path& p);

/**
 * Ordered list of absolute locations to probe for raw, without touching the filesystem.
 *
 * The first element is the primary candidate (raw itself if absolute, else cwd/raw).
 * When is_store(env.cwd) holds, it is followed by home/<basename> and
 * home/.config/multi-mcp/<basename>, where basename is the last component of raw as typed.
 * Every entry is lexically normalized.
 * Empty raw yields an empty list.
 */
std::vector<std::filesystem::path> candidate_paths(const std::string& raw, const ResolveEnv& env,
                                                   const StorePredicate& is_store = is_store_path);

class PathResolver {
public:
    explicit PathResolver(logging::Logger& log,
                          ResolveEnv env = current_env(),
                          FileProbe probe = is_regular_file,
                          StorePredicate is_store = is_store_path);

    std::vector<std::filesystem::path> candidates(const std::string& raw) const;

    // First candidate accepted by the probe. Throws NotFoundError listing everything probed.
    std::filesystem::path resolve(const std::string& raw) const;

    const ResolveEnv& env() const { return env_; }

private:
    logging::Logger& log_;
    ResolveEnv env_;
    FileProbe probe_;
    StorePredicate is_store_;
};

} // namespace multimcp::config

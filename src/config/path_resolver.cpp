/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include <multimcp/config/path_resolver.hpp>

#include <cstdlib>
#include <system_error>
#include <utility>

#include <pwd.h>
#include <unistd.h>

#include <fmt/format.h>

#include <multimcp/config/errors.hpp>
#include <multimcp/config/types.hpp>

namespace fs = std::filesystem;

namespace multimcp::config {

fs::path home_directory() {
    if (const char* v = std::getenv("HOME"); v != nullptr && *v != '\0') return fs::path(v);
    if (const passwd* pw = ::getpwuid(::getuid()); pw != nullptr && pw->pw_dir != nullptr) {
        return fs::path(pw->pw_dir);
    }
    return {};
}

ResolveEnv current_env() {
    return ResolveEnv{fs::current_path(), home_directory()};
}

fs::path expand_tilde(const std::string& raw, const fs::path& home) {
    if (raw.empty() || raw[0] != '~' || home.empty()) return fs::path(raw);
    if (raw.size() == 1) return home;
    if (raw[1] != '/') return fs::path(raw);
    return home / raw.substr(2);
}

bool is_store_path(const fs::path& dir) {
    bool prev_is_nix = false;
    for (const auto& part : dir) {
        const auto s = part.string();
        if (prev_is_nix && s == "store") return true;
        prev_is_nix = (s == "nix");
    }
    return false;
}

bool is_regular_file(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec);
}

std::vector<fs::path> candidate_paths(const std::string& raw, const ResolveEnv& env,
                                      const StorePredicate& is_store) {
    std::vector<fs::path> out;
    if (raw.empty()) return out;

    const fs::path expanded = expand_tilde(raw, env.home);
    const fs::path primary = expanded.is_absolute() ? expanded : env.cwd / expanded;
    out.push_back(primary.lexically_normal());

    if (env.home.empty() || !is_store(env.cwd)) return out;

    // Basename of what the user typed; a bare "~" names the home directory, not a file.
    const fs::path name = fs::path(raw).filename();
    if (name.empty() || name == "." || name == ".." || name == "~") return out;

    out.push_back((env.home / name).lexically_normal());
    out.push_back((env.home / ".config" / kAppName / name).lexically_normal());
    return out;
}

PathResolver::PathResolver(logging::Logger& log, ResolveEnv env, FileProbe probe,
                           StorePredicate is_store)
    : log_(log), env_(std::move(env)), probe_(std::move(probe)), is_store_(std::move(is_store)) {}

std::vector<fs::path> PathResolver::candidates(const std::string& raw) const {
    return candidate_paths(raw, env_, is_store_);
}

fs::path PathResolver::resolve(const std::string& raw) const {
    const auto all = candidates(raw);
    std::vector<fs::path> attempted;
    attempted.reserve(all.size());

    for (std::size_t i = 0; i < all.size(); ++i) {
        if (i == 1) {
            log_.info(fmt::format("{} not found and working directory {} is a package store; "
                                  "trying home directory fallbacks",
                                  all[0].string(), env_.cwd.string()));
        }
        const auto& candidate = all[i];
        attempted.push_back(candidate);
        log_.debug(fmt::format("probing config candidate {}", candidate.string()));
        if (probe_(candidate)) {
            log_.debug(fmt::format("resolved '{}' to {}", raw, candidate.string()));
            return candidate;
        }
    }
    throw NotFoundError(raw, std::move(attempted));
}

} // namespace multimcp::config

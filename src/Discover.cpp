/**
 * @file Discover.cpp
 * @brief Implementation of config discovery
 */

#include "agentcfg/Discover.hpp"
#include "agentcfg/Log.hpp"
#include "agentcfg/Util.hpp"

#include <cstdio>
#include <filesystem>

namespace fs = std::filesystem;

namespace agentcfg {

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

std::optional<std::string> find_git_root() {
    FILE* pipe = ::popen("git rev-parse --show-toplevel 2>/dev/null", "r");
    if (pipe == nullptr) {
        logger()->debug("git root lookup: popen failed");
        return std::nullopt;
    }

    std::string output;
    char buf[512];
    while (std::fgets(buf, sizeof(buf), pipe) != nullptr) {
        output += buf;
    }

    const int status = ::pclose(pipe);
    if (status != 0) {
        logger()->debug("git root lookup: not a repository (status {})", status);
        return std::nullopt;
    }

    output = trim(output);
    if (output.empty()) {
        return std::nullopt;
    }
    return output;
}

DiscoverOptions default_discover_options() {
    DiscoverOptions opts;
    opts.paths = resolve_config_paths();
    opts.exists = path_exists;
    opts.find_repo_root = find_git_root;
    return opts;
}

namespace {

std::optional<std::string> lookup_repo_root(const DiscoverOptions& opts) {
    if (!opts.find_repo_root) {
        return std::nullopt;
    }
    try {
        return opts.find_repo_root();
    } catch (const std::exception& e) {
        logger()->debug("git root lookup failed: {}", e.what());
        return std::nullopt;
    }
}

} // anonymous namespace

std::optional<std::string> discover_config_path(const DiscoverOptions& opts) {
    const ExistsFn exists = opts.exists ? opts.exists : ExistsFn(path_exists);

    if (exists(opts.paths.project_path)) {
        logger()->debug("Using project config {}", opts.paths.project_path);
        return opts.paths.project_path;
    }

    if (auto root = lookup_repo_root(opts); root.has_value() && !root->empty()) {
        const std::string candidate = project_config_path(*root);
        if (candidate != opts.paths.project_path && exists(candidate)) {
            logger()->debug("Using repository config {}", candidate);
            return candidate;
        }
    }

    if (exists(opts.paths.user_path)) {
        logger()->debug("Using user config {}", opts.paths.user_path);
        return opts.paths.user_path;
    }

    return std::nullopt;
}

std::string resolve_config_path(const std::optional<std::string>& explicit_path,
                                const DiscoverOptions& opts) {
    if (explicit_path.has_value() && !explicit_path->empty()) {
        return *explicit_path;
    }
    if (auto found = discover_config_path(opts)) {
        return *found;
    }
    logger()->debug("No config found, defaulting to {}", opts.paths.user_path);
    return opts.paths.user_path;
}

} // namespace agentcfg

/**
 * @file Discover.hpp
 * @brief Active config file discovery
 *
 * Resolution precedence (highest first):
 * 1. Explicit path given by the caller (empty means "not given")
 * 2. Project config in the working directory
 * 3. Project config at the repository root
 * 4. User config, if it exists
 * 5. User config path as the save target for a new config
 */

#ifndef AGENTCFG_DISCOVER_HPP
#define AGENTCFG_DISCOVER_HPP

#include "agentcfg/Paths.hpp"
#include <functional>
#include <optional>
#include <string>

namespace agentcfg {

using ExistsFn = std::function<bool(const std::string&)>;
using RepoRootFn = std::function<std::optional<std::string>()>;

/**
 * @brief Inputs to discovery; every capability is substitutable.
 */
struct DiscoverOptions {
    ConfigPaths paths;
    ExistsFn exists;
    RepoRootFn find_repo_root;
};

/**
 * @brief Options bound to the real filesystem, environment and git.
 */
DiscoverOptions default_discover_options();

/**
 * @brief Check whether a path exists on disk (errors count as absent).
 */
bool path_exists(const std::string& path);

/**
 * @brief Top-level directory of the git repository containing the cwd.
 *
 * Runs `git rev-parse --show-toplevel`. Any failure (not a repository,
 * git not installed, the process cannot be spawned) yields nullopt.
 */
std::optional<std::string> find_git_root();

/**
 * @brief Find the active config file.
 *
 * Checks the project path, then the repository-root project path, then the
 * user path. A repository-root lookup that throws is treated as "no root".
 *
 * @return Path of the first existing candidate, or nullopt if none exist
 */
std::optional<std::string> discover_config_path(const DiscoverOptions& opts);

/**
 * @brief Resolve the config path to read from and save to.
 *
 * @param explicit_path Caller-supplied path; empty or nullopt means not given
 * @param opts Discovery options
 * @return explicit_path, else the discovered path, else the user path
 */
std::string resolve_config_path(const std::optional<std::string>& explicit_path,
                                const DiscoverOptions& opts);

} // namespace agentcfg

#endif // AGENTCFG_DISCOVER_HPP

/**
 * @file Paths.hpp
 * @brief Candidate config file locations
 *
 * Two locations are searched, project first:
 * - <cwd>/.opencode/oh-my-opencode.json
 * - <home>/.config/opencode/oh-my-opencode.json
 */

#ifndef AGENTCFG_PATHS_HPP
#define AGENTCFG_PATHS_HPP

#include <string>

namespace agentcfg {

inline constexpr const char* kConfigFileName = "oh-my-opencode.json";
inline constexpr const char* kProjectConfigDir = ".opencode";
inline constexpr const char* kUserConfigDir = ".config/opencode";

/**
 * @brief The two candidate paths, in discovery order.
 */
struct ConfigPaths {
    std::string project_path;
    std::string user_path;
};

/**
 * @brief Project config path under a given root directory.
 *
 * Used for both the working directory and a repository root.
 */
std::string project_config_path(const std::string& root);

/**
 * @brief Compute candidate paths from explicit directories.
 */
ConfigPaths resolve_config_paths(const std::string& cwd, const std::string& home);

/**
 * @brief Compute candidate paths from the process environment.
 *
 * Uses the current working directory and home_directory(). Never fails:
 * an unreadable working directory degrades to ".".
 */
ConfigPaths resolve_config_paths();

} // namespace agentcfg

#endif // AGENTCFG_PATHS_HPP

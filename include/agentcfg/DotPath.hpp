/**
 * @file DotPath.hpp
 * @brief Dot-notation paths for config entries
 *
 * Entries are addressed as "<section>.<name>", e.g. "agents.oracle".
 * Diff entries, validation issues and CLI arguments all use this form.
 */

#ifndef AGENTCFG_DOTPATH_HPP
#define AGENTCFG_DOTPATH_HPP

#include <string>
#include <utility>
#include <vector>

namespace agentcfg {

/**
 * @brief Join path segments with dots
 *
 * Examples:
 * - ["agents", "oracle", "model"] → "agents.oracle.model"
 * - [] → ""
 */
std::string join_dot_path(const std::vector<std::string>& segments);

/**
 * @brief Split an entry path into section and name at the first dot
 *
 * Names may themselves contain dots; only the first one separates.
 *
 * @param path Entry path like "categories.unspecified-high"
 * @return {section, name}; name is empty when the path has no dot
 */
std::pair<std::string, std::string> split_entry_path(const std::string& path);

} // namespace agentcfg

#endif // AGENTCFG_DOTPATH_HPP

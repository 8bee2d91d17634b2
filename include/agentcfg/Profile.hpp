/**
 * @file Profile.hpp
 * @brief Named config profiles switched through a symbolic link
 *
 * Profiles live next to the config as "oh-my-opencode-<name>.json". The
 * active profile is selected by making "oh-my-opencode.json" a symbolic
 * link to one of them:
 *
 * @code
 * ~/.config/opencode/
 *     oh-my-opencode.json -> oh-my-opencode-work.json
 *     oh-my-opencode-default.json
 *     oh-my-opencode-work.json
 *     oh-my-opencode.template.json   (optional base for every save)
 * @endcode
 *
 * Because save_config() writes through symbolic links, every other command
 * edits the active profile in place.
 */

#ifndef AGENTCFG_PROFILE_HPP
#define AGENTCFG_PROFILE_HPP

#include "agentcfg/Config.hpp"
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace agentcfg {

inline constexpr const char* kProfileFilePrefix = "oh-my-opencode-";
inline constexpr const char* kProfileFileSuffix = ".json";
inline constexpr const char* kProfileTemplateFileName = "oh-my-opencode.template.json";
inline constexpr std::size_t kProfileNameMaxLength = 32;

/**
 * @brief Names that cannot be given to a new profile.
 *
 * "default" is created automatically on the first save and can still be
 * used, deleted or renamed.
 */
const std::vector<std::string>& reserved_profile_names();

struct ProfileInfo {
    std::string name;
    bool active = false;
    std::filesystem::file_time_type created;
};

/**
 * @brief Options for save_profile()
 */
struct SaveProfileOptions {
    /// Main config path; its directory is searched for the template.
    /// Defaults to <dir>/oh-my-opencode.json.
    std::optional<std::string> config_path;

    /// Template to merge under the saved config, used if it exists
    std::optional<std::string> template_path;
};

/**
 * @brief Check a profile name: 1-32 characters from [A-Za-z0-9_-].
 *
 * @param allow_reserved Accept reserved names (for existing profiles)
 * @throws ProfileNameError describing the first rule broken
 */
void validate_profile_name(const std::string& name, bool allow_reserved = false);

std::string profile_path(const std::string& config_dir, const std::string& name);

/**
 * @brief Path of the active-profile link, <dir>/oh-my-opencode.json.
 */
std::string active_config_path(const std::string& config_dir);

/**
 * @brief Name of the profile the config link points at.
 *
 * @return nullopt if the config is a regular file, missing, or a link to
 *         something other than a profile file
 * @throws DanglingSymlink if the link target does not exist
 */
std::optional<std::string> active_profile_name(const std::string& config_dir);

/**
 * @brief Profiles in a directory, oldest first.
 *
 * @throws DanglingSymlink if the active link is dangling
 */
std::vector<ProfileInfo> list_profiles(const std::string& config_dir);

/**
 * @brief Merge a config over a template and validate the result.
 *
 * @throws InvalidConfig "Template merge failed: ..." if the result is invalid
 */
Config apply_template(const Config& template_cfg, const Config& cfg);

/**
 * @brief Write a config as a named profile.
 *
 * When a template is found (options.template_path if it exists, otherwise
 * oh-my-opencode.template.json beside the config) the config is merged
 * over it. The first save of a non-"default" profile in a directory
 * without profiles also writes "default" from the current config.
 *
 * @throws ProfileNameError if the name is invalid or reserved
 * @throws InvalidConfig if the config or the template merge is invalid
 * @throws PermissionDenied / std::filesystem::filesystem_error on I/O failure
 */
void save_profile(const std::string& config_dir, const std::string& name, const Config& cfg,
                  const SaveProfileOptions& options = {});

/**
 * @brief Point the config link at a profile.
 *
 * The link is replaced atomically by renaming a fresh link over it. A
 * regular config file at that path is replaced by the link.
 *
 * @throws ProfileNotFound if the profile does not exist
 * @throws PermissionDenied if the link cannot be created
 * @throws ProfileError for other link failures
 */
void use_profile(const std::string& config_dir, const std::string& name);

/**
 * @throws ProfileNotFound if the profile does not exist
 * @throws ProfileActive if it is the active profile
 */
void delete_profile(const std::string& config_dir, const std::string& name);

/**
 * @brief Rename a profile, moving the active link with it.
 *
 * If the link cannot be updated the rename is undone.
 *
 * @throws ProfileNotFound if old_name does not exist
 * @throws ProfileExists if new_name is taken
 * @throws ProfileNameError if new_name is invalid or reserved
 */
void rename_profile(const std::string& config_dir, const std::string& old_name,
                    const std::string& new_name);

/**
 * @brief Where `profile template` writes, given an optional override.
 *
 * Relative overrides resolve against the config directory.
 *
 * @throws InvalidConfig if the path is outside the config directory
 */
std::string template_output_path(const std::string& config_dir,
                                 const std::optional<std::string>& override_path = std::nullopt);

/**
 * @brief Atomically make link_path a symbolic link to target.
 *
 * @throws PermissionDenied / std::filesystem::filesystem_error on failure
 */
void update_symlink(const std::string& target, const std::string& link_path);

} // namespace agentcfg

#endif // AGENTCFG_PROFILE_HPP

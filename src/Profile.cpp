/**
 * @file Profile.cpp
 * @brief Profile files and the active-profile symbolic link
 */

#include "agentcfg/Profile.hpp"
#include "agentcfg/Errors.hpp"
#include "agentcfg/Loader.hpp"
#include "agentcfg/Log.hpp"
#include "agentcfg/Merge.hpp"
#include "agentcfg/Paths.hpp"
#include "agentcfg/Schema.hpp"
#include "agentcfg/Util.hpp"
#include "agentcfg/Writer.hpp"

#include <algorithm>
#include <cctype>

#include <unistd.h>

namespace fs = std::filesystem;

namespace agentcfg {

namespace {

constexpr const char* kTempLinkSuffix = ".tmp.link";

bool file_exists(const std::string& path) {
    std::error_code ec;
    const bool exists = fs::exists(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        throw_file_error(ec, path, "read");
    }
    return exists;
}

std::string profile_file_name(const std::string& name) {
    return std::string(kProfileFilePrefix) + name + kProfileFileSuffix;
}

// "oh-my-opencode-<name>.json" -> name
std::optional<std::string> profile_name_from_file(const std::string& file_name) {
    const std::string prefix = kProfileFilePrefix;
    const std::string suffix = kProfileFileSuffix;
    if (file_name.size() <= prefix.size() + suffix.size()) return std::nullopt;
    if (file_name.compare(0, prefix.size(), prefix) != 0) return std::nullopt;
    if (file_name.compare(file_name.size() - suffix.size(), suffix.size(), suffix) != 0) {
        return std::nullopt;
    }
    return file_name.substr(prefix.size(), file_name.size() - prefix.size() - suffix.size());
}

std::vector<std::string> find_profile_names(const std::string& config_dir) {
    std::vector<std::string> names;
    std::error_code ec;
    fs::directory_iterator it(config_dir, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory) return names;
        throw_file_error(ec, config_dir, "read");
    }
    for (const auto& entry : it) {
        if (auto name = profile_name_from_file(entry.path().filename().string())) {
            names.push_back(std::move(*name));
        }
    }
    return names;
}

// A config file that does not exist yields nullopt instead of defaults.
std::optional<Config> load_existing_config(const std::string& path) {
    if (!file_exists(path)) {
        return std::nullopt;
    }
    return parse_config(load_config_value(path), path);
}

std::optional<Config> load_template(const std::string& config_dir,
                                    const SaveProfileOptions& options) {
    if (options.template_path && file_exists(*options.template_path)) {
        return load_existing_config(*options.template_path);
    }
    const fs::path config_path = options.config_path.value_or(active_config_path(config_dir));
    const fs::path fallback = config_path.parent_path() / kProfileTemplateFileName;
    return load_existing_config(fallback.string());
}

void write_profile(const std::string& path, const Config& cfg) {
    const Value j = cfg;
    atomic_write(path, j.dump(2) + "\n");
}

bool is_within(const fs::path& candidate, const fs::path& base) {
    const fs::path rel = candidate.lexically_relative(base);
    if (rel.empty()) return false;
    return rel.begin()->string() != "..";
}

} // anonymous namespace

const std::vector<std::string>& reserved_profile_names() {
    static const std::vector<std::string> names = {
        "default", "backup", "temp", "current", "oh-my-opencode"
    };
    return names;
}

void validate_profile_name(const std::string& name, bool allow_reserved) {
    if (name.empty() || name.size() > kProfileNameMaxLength) {
        throw ProfileNameError(name, "must be between 1 and " +
                                     std::to_string(kProfileNameMaxLength) + " characters");
    }
    const bool allowed_chars = std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '_';
    });
    if (!allowed_chars) {
        throw ProfileNameError(name, "must contain only letters, numbers, hyphens, and underscores");
    }
    if (!allow_reserved) {
        const auto& reserved = reserved_profile_names();
        if (std::find(reserved.begin(), reserved.end(), name) != reserved.end()) {
            throw ProfileNameError(name, "is a reserved name");
        }
    }
}

std::string profile_path(const std::string& config_dir, const std::string& name) {
    return (fs::path(config_dir) / profile_file_name(name)).string();
}

std::string active_config_path(const std::string& config_dir) {
    return (fs::path(config_dir) / kConfigFileName).string();
}

std::optional<std::string> active_profile_name(const std::string& config_dir) {
    const fs::path link = active_config_path(config_dir);

    std::error_code ec;
    if (!fs::is_symlink(fs::symlink_status(link, ec))) {
        return std::nullopt;
    }
    const fs::path target = fs::read_symlink(link, ec);
    if (ec) {
        logger()->debug("Cannot read link {}: {}", link.string(), ec.message());
        return std::nullopt;
    }

    const fs::path resolved = target.is_absolute() ? target : fs::path(config_dir) / target;
    if (!file_exists(resolved.string())) {
        throw DanglingSymlink(target.string());
    }
    return profile_name_from_file(target.filename().string());
}

std::vector<ProfileInfo> list_profiles(const std::string& config_dir) {
    const auto active = active_profile_name(config_dir);

    std::vector<ProfileInfo> profiles;
    for (auto& name : find_profile_names(config_dir)) {
        const std::string path = profile_path(config_dir, name);
        std::error_code ec;
        ProfileInfo info;
        info.created = fs::last_write_time(path, ec);
        if (ec) {
            throw_file_error(ec, path, "read");
        }
        info.active = active.has_value() && *active == name;
        info.name = std::move(name);
        profiles.push_back(std::move(info));
    }

    std::sort(profiles.begin(), profiles.end(), [](const ProfileInfo& a, const ProfileInfo& b) {
        if (a.created != b.created) return a.created < b.created;
        return a.name < b.name;
    });
    return profiles;
}

Config apply_template(const Config& template_cfg, const Config& cfg) {
    return merge_configs(template_cfg, cfg, "Template merge failed");
}

void save_profile(const std::string& config_dir, const std::string& name, const Config& cfg,
                  const SaveProfileOptions& options) {
    validate_profile_name(name);

    const Config validated = parse_config(Value(cfg), "Config validation failed");
    const auto template_cfg = load_template(config_dir, options);
    const Config output = template_cfg ? apply_template(*template_cfg, validated) : validated;

    if (name != "default" && find_profile_names(config_dir).empty()) {
        const std::string config_path = options.config_path.value_or(active_config_path(config_dir));
        Config default_cfg = output;
        if (auto current = load_existing_config(config_path)) {
            default_cfg = template_cfg ? apply_template(*template_cfg, *current) : *current;
        }
        write_profile(profile_path(config_dir, "default"), default_cfg);
        logger()->info("Created default profile from {}", config_path);
    }

    write_profile(profile_path(config_dir, name), output);
    logger()->info("Saved profile {}", name);
}

void update_symlink(const std::string& target, const std::string& link_path) {
    const std::string tmp_link = link_path + kTempLinkSuffix;

    std::error_code ec;
    if (fs::remove(tmp_link, ec)) {
        logger()->debug("Removed stale {}", tmp_link);
    }

    fs::create_symlink(target, tmp_link, ec);
    if (ec) {
        throw_file_error(ec, link_path, "create symlink");
    }
    fs::rename(tmp_link, link_path, ec);
    if (ec) {
        ::unlink(tmp_link.c_str());
        throw_file_error(ec, link_path, "create symlink");
    }
    logger()->debug("Linked {} -> {}", link_path, target);
}

void use_profile(const std::string& config_dir, const std::string& name) {
    validate_profile_name(name, true);

    if (!file_exists(profile_path(config_dir, name))) {
        throw ProfileNotFound(name);
    }

    try {
        update_symlink(profile_file_name(name), active_config_path(config_dir));
    } catch (const fs::filesystem_error& e) {
        throw ProfileError("Failed to switch to profile \"" + name + "\": " + e.what());
    }
    logger()->info("Switched to profile {}", name);
}

void delete_profile(const std::string& config_dir, const std::string& name) {
    validate_profile_name(name, true);

    const std::string path = profile_path(config_dir, name);
    if (!file_exists(path)) {
        throw ProfileNotFound(name);
    }
    if (active_profile_name(config_dir) == name) {
        throw ProfileActive(name);
    }

    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        throw_file_error(ec, path, "delete");
    }
    logger()->info("Deleted profile {}", name);
}

void rename_profile(const std::string& config_dir, const std::string& old_name,
                    const std::string& new_name) {
    validate_profile_name(old_name, true);
    validate_profile_name(new_name);

    const std::string old_path = profile_path(config_dir, old_name);
    const std::string new_path = profile_path(config_dir, new_name);
    if (!file_exists(old_path)) {
        throw ProfileNotFound(old_name);
    }
    if (file_exists(new_path)) {
        throw ProfileExists(new_name);
    }

    const bool was_active = active_profile_name(config_dir) == old_name;

    std::error_code ec;
    fs::rename(old_path, new_path, ec);
    if (ec) {
        throw_file_error(ec, old_path, "rename");
    }

    if (was_active) {
        try {
            update_symlink(profile_file_name(new_name), active_config_path(config_dir));
        } catch (const std::exception& e) {
            std::error_code revert_ec;
            fs::rename(new_path, old_path, revert_ec);
            if (revert_ec) {
                logger()->error("Could not restore {}: {}", old_path, revert_ec.message());
            }
            throw ProfileError(std::string("Failed to update active profile symlink after rename: ") +
                               e.what());
        }
    }
    logger()->info("Renamed profile {} to {}", old_name, new_name);
}

std::string template_output_path(const std::string& config_dir,
                                 const std::optional<std::string>& override_path) {
    const fs::path base = fs::weakly_canonical(fs::absolute(config_dir));
    const std::string trimmed = override_path ? trim(*override_path) : std::string();

    fs::path candidate = base / kProfileTemplateFileName;
    if (!trimmed.empty()) {
        const fs::path p(trimmed);
        candidate = p.is_absolute() ? p : base / p;
    }
    candidate = fs::weakly_canonical(candidate);

    if (!is_within(candidate, base)) {
        throw InvalidConfig("Template path must be within " + base.string());
    }
    return candidate.string();
}

} // namespace agentcfg

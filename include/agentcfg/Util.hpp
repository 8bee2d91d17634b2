#ifndef AGENTCFG_UTIL_HPP
#define AGENTCFG_UTIL_HPP

#include <filesystem>
#include <optional>
#include <string>

namespace agentcfg {

// Read an environment variable; nullopt if unset.
std::optional<std::string> get_env_var(const std::string& name);

// Home directory from $HOME, falling back to the password database.
std::string home_directory();

// Helpers
std::string to_lower(std::string s);
std::string trim(const std::string& s);

// File timestamp as local "YYYY-MM-DD HH:MM:SS".
std::string format_file_time(std::filesystem::file_time_type t);

} // namespace agentcfg

#endif // AGENTCFG_UTIL_HPP

/**
 * @file Loader.hpp
 * @brief Reading config files
 *
 * A missing config file yields the built-in defaults. A file that exists
 * but is malformed or fails validation is a hard error; defaults are never
 * substituted for corrupt content.
 */

#ifndef AGENTCFG_LOADER_HPP
#define AGENTCFG_LOADER_HPP

#include "agentcfg/Config.hpp"
#include "agentcfg/Value.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace agentcfg {

/**
 * @brief Load and validate the config at path.
 *
 * @param path Config file path
 * @return Validated Config, or default_config() if the file does not exist
 * @throws InvalidConfig "Malformed JSON in <path>: ..." for syntax errors
 * @throws InvalidConfig "<path>: <field>: <reason>, ..." for schema errors
 * @throws PermissionDenied if the file cannot be read
 * @throws std::filesystem::filesystem_error for other I/O failures
 */
Config load_config(const std::string& path);

/**
 * @brief Read and parse a JSON file without schema validation.
 *
 * @param path JSON file path (must exist)
 * @return Parsed document
 * @throws FileNotFoundError if the file does not exist
 * @throws InvalidConfig if the content is not valid JSON
 * @throws PermissionDenied / std::filesystem::filesystem_error on I/O failure
 */
Value load_config_value(const std::string& path);

/**
 * @brief Parse JSON text, reporting syntax errors against a path.
 *
 * @throws InvalidConfig "Malformed JSON in <path>: ..."
 */
Value parse_json_text(const std::string& content, const std::string& path);

/**
 * @brief Read a whole file into a string.
 *
 * @throws FileNotFoundError if the file does not exist
 * @throws PermissionDenied if access is refused
 * @throws std::filesystem::filesystem_error for other I/O failures,
 *         including a path that names a directory
 */
std::string read_text_file(const std::string& path);

/**
 * @brief Last-modified time of a file, following symlinks.
 *
 * Capture this before editing and pass it to save_config() as the
 * expected mtime.
 *
 * @return The mtime, or nullopt if the file does not exist
 * @throws PermissionDenied / std::filesystem::filesystem_error on other errors
 */
std::optional<std::filesystem::file_time_type> get_file_mtime(const std::string& path);

} // namespace agentcfg

#endif // AGENTCFG_LOADER_HPP

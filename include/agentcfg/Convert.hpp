/**
 * @file Convert.hpp
 * @brief JSON and TOML interchange for import and export
 *
 * The config file itself is always JSON; TOML is accepted by `import` and
 * produced by `export --format toml`. A TOML document mirrors the JSON
 * layout, one table per binding:
 *
 * @code
 * [agents.oracle]
 * model = "openai/gpt-5.2"
 * variant = "high"
 * @endcode
 */

#ifndef AGENTCFG_CONVERT_HPP
#define AGENTCFG_CONVERT_HPP

#include "agentcfg/Config.hpp"
#include <string>

namespace agentcfg {

/**
 * @brief Supported interchange formats
 */
enum class FileFormat {
    Json,
    Toml
};

/**
 * @brief Guess the format from a file extension (".toml" or JSON otherwise).
 */
FileFormat format_from_path(const std::string& path);

/**
 * @brief Parse a format name ("json" / "toml", case-insensitive).
 *
 * @throws std::invalid_argument for other names
 */
FileFormat parse_format(const std::string& name);

/**
 * @brief Render a config as a TOML document.
 *
 * Absent sections are omitted; an unset variant has no key.
 */
std::string config_to_toml(const Config& cfg);

/**
 * @brief Parse and validate a TOML config document.
 *
 * Only tables and strings may appear. Any other TOML value (numbers,
 * booleans, dates, arrays) is reported with its dotted path.
 *
 * @param content TOML source
 * @param path Path used in error messages
 * @throws InvalidConfig "Malformed TOML in <path> (line L, column C): ..."
 *         on syntax errors, "<path>: ..." on rejected values or schema issues
 */
Config config_from_toml(const std::string& content, const std::string& path);

/**
 * @brief Read and validate a config file in the given format.
 *
 * @throws FileNotFoundError if the file does not exist
 * @throws InvalidConfig if the content does not parse or validate
 */
Config load_config_file(const std::string& path, FileFormat format);

/**
 * @brief Serialize a config in the given format (JSON uses 2-space indent).
 */
std::string dump_config(const Config& cfg, FileFormat format);

} // namespace agentcfg

#endif // AGENTCFG_CONVERT_HPP

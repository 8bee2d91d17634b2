/**
 * @file Schema.hpp
 * @brief Structural validation of raw config values
 *
 * Converts an untrusted Value into a typed Config, or reports every
 * offending field with its dot-path.
 *
 * Rules:
 * - The root must be an object
 * - "agents" and "categories", when present, must be objects
 * - Each entry must be an object with a non-empty string "model"
 * - "variant", when present, must be a string
 * - Entry names must be non-empty
 * - Unknown keys are ignored and dropped from the typed result
 */

#ifndef AGENTCFG_SCHEMA_HPP
#define AGENTCFG_SCHEMA_HPP

#include "agentcfg/Config.hpp"
#include "agentcfg/Errors.hpp"
#include "agentcfg/Value.hpp"
#include <optional>
#include <string>
#include <vector>

namespace agentcfg {

/**
 * @brief Outcome of validate_config(): a Config or a list of issues
 */
struct ValidationResult {
    std::optional<Config> config;
    std::vector<ValidationIssue> issues;

    bool ok() const noexcept { return config.has_value(); }
};

/**
 * @brief Validate a raw value against the Config schema.
 *
 * Collects all issues rather than stopping at the first one.
 *
 * @param raw Parsed JSON document
 * @return ValidationResult with config set on success, issues otherwise
 */
ValidationResult validate_config(const Value& raw);

/**
 * @brief Join issues as "path: message, path: message".
 *
 * The root path renders as "(root)".
 */
std::string format_issues(const std::vector<ValidationIssue>& issues);

/**
 * @brief Validate or throw.
 *
 * @param raw Parsed JSON document
 * @param context Prefix for the error message (usually the file path)
 * @return Validated Config
 * @throws InvalidConfig listing every issue
 */
Config parse_config(const Value& raw, const std::string& context);

} // namespace agentcfg

#endif // AGENTCFG_SCHEMA_HPP

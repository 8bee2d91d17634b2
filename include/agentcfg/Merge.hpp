/**
 * @file Merge.hpp
 * @brief Deep merge utilities for configuration layers
 *
 * Merging rules:
 * - Override absent: base is returned unchanged
 * - Both objects: union of keys; shared keys merge recursively when both
 *   sides are objects, otherwise the override value wins
 * - Anything else: the override value replaces base entirely (arrays are
 *   replaced wholesale, never concatenated)
 *
 * The reserved keys "__proto__", "constructor" and "prototype" are dropped
 * at every nesting level of a merged result, whichever side defines them.
 */

#ifndef AGENTCFG_MERGE_HPP
#define AGENTCFG_MERGE_HPP

#include "agentcfg/Config.hpp"
#include "agentcfg/Value.hpp"
#include <optional>
#include <string>
#include <vector>

namespace agentcfg {

/**
 * @brief Deep merge two values
 *
 * Pure function; neither input is modified.
 *
 * @param base Base value (lower precedence)
 * @param override_val Override value (higher precedence); nullopt = absent
 * @return Merged result
 *
 * Examples:
 * ```cpp
 * Value base = {{"a", 1}, {"b", 2}};
 * Value over = {{"b", 3}, {"c", 4}};
 * auto result = deep_merge(base, over);
 * // Result: {"a": 1, "b": 3, "c": 4}
 *
 * Value base2 = {{"arr", {1, 2}}};
 * Value over2 = {{"arr", {3}}};
 * auto result2 = deep_merge(base2, over2);
 * // Result: {"arr": [3]}
 * ```
 */
Value deep_merge(const Value& base, const std::optional<Value>& override_val);

/**
 * @brief Deep merge multiple sources in order
 *
 * Applies each source in sequence from lowest to highest precedence.
 *
 * @param sources Values to merge (in precedence order)
 * @return Merged result, or an empty object if sources is empty
 */
Value deep_merge_all(const std::vector<Value>& sources);

/**
 * @brief Copy of a value with reserved keys removed at every level.
 */
Value strip_reserved_keys(const Value& val);

/**
 * @brief Merge two configs and re-validate the result
 *
 * Bindings present in both are merged field by field, so an override that
 * only sets "model" keeps the base "variant".
 *
 * @param base Base config (e.g. a template or the current file)
 * @param override_cfg Config whose values win
 * @param context Message prefix used when the result is invalid
 * @return Validated merged Config
 * @throws InvalidConfig "<context>: ..." if the result is invalid
 */
Config merge_configs(const Config& base, const Config& override_cfg,
                     const std::string& context = "Merge result");

} // namespace agentcfg

#endif // AGENTCFG_MERGE_HPP

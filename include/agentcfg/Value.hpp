/**
 * @file Value.hpp
 * @brief Value type for raw configuration data
 *
 * Uses nlohmann::json as the untyped value model. Typed access to a
 * validated configuration goes through agentcfg::Config (see Config.hpp).
 */

#ifndef AGENTCFG_VALUE_HPP
#define AGENTCFG_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace agentcfg {

/**
 * @brief JSON-like value type for configuration
 *
 * Alias for nlohmann::json. Config files are read into a Value, validated
 * into a Config, and serialized back from a Value.
 */
using Value = nlohmann::json;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string ("null", "boolean", "number", "string",
 *         "array", "object")
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number()) return "number";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "object";
    return "unknown";
}

/**
 * @brief Check if value is a plain key-value mapping
 *
 * Only JSON objects are mergeable; arrays, null and scalars are not.
 */
inline bool is_plain_object(const Value& val) {
    return val.is_object();
}

/**
 * @brief Check if a key is on the reserved denylist
 *
 * "__proto__", "constructor" and "prototype" are dropped from merged
 * values so files written by older tooling never carry them forward.
 */
inline bool is_reserved_key(const std::string& key) {
    return key == "__proto__" || key == "constructor" || key == "prototype";
}

} // namespace agentcfg

#endif // AGENTCFG_VALUE_HPP

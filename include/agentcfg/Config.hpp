#ifndef AGENTCFG_CONFIG_HPP
#define AGENTCFG_CONFIG_HPP

#include "agentcfg/Value.hpp"
#include <map>
#include <optional>
#include <string>

namespace agentcfg {

/**
 * @brief A model identifier plus an optional variant qualifier.
 *
 * `model` is never empty in a validated Config.
 */
struct ModelBinding {
    std::string model;
    std::optional<std::string> variant;
};

inline bool operator==(const ModelBinding& a, const ModelBinding& b) {
    return a.model == b.model && a.variant == b.variant;
}

inline bool operator!=(const ModelBinding& a, const ModelBinding& b) {
    return !(a == b);
}

using BindingMap = std::map<std::string, ModelBinding>;

/**
 * @brief Typed configuration: agents and categories bound to models.
 *
 * Both sections are optional; an absent section and an empty one are kept
 * distinct so files round-trip unchanged.
 */
struct Config {
    std::optional<BindingMap> agents;
    std::optional<BindingMap> categories;

    // Section by name ("agents" / "categories"); nullptr for other names
    std::optional<BindingMap>* section(const std::string& name);
    const std::optional<BindingMap>* section(const std::string& name) const;

    // Serialization
    std::string to_json_string(int indent = 2) const;
};

inline bool operator==(const Config& a, const Config& b) {
    return a.agents == b.agents && a.categories == b.categories;
}

inline bool operator!=(const Config& a, const Config& b) {
    return !(a == b);
}

// Section names in diff/report order
inline constexpr const char* kAgentsSection = "agents";
inline constexpr const char* kCategoriesSection = "categories";

// nlohmann::json ADL hooks. from_json expects an already-validated value;
// use validate_config() (Schema.hpp) for untrusted input.
void to_json(Value& j, const ModelBinding& b);
void from_json(const Value& j, ModelBinding& b);
void to_json(Value& j, const Config& c);
void from_json(const Value& j, Config& c);

/**
 * @brief Render a binding as "model" or "model (variant)".
 */
std::string describe(const ModelBinding& b);

} // namespace agentcfg

#endif // AGENTCFG_CONFIG_HPP

/**
 * @file Merge.cpp
 * @brief Implementation of deep merge
 */

#include "agentcfg/Merge.hpp"
#include "agentcfg/Errors.hpp"
#include "agentcfg/Schema.hpp"

namespace agentcfg {

Value strip_reserved_keys(const Value& val) {
    if (val.is_object()) {
        Value result = Value::object();
        for (auto it = val.begin(); it != val.end(); ++it) {
            if (is_reserved_key(it.key())) continue;
            result[it.key()] = strip_reserved_keys(it.value());
        }
        return result;
    }

    if (val.is_array()) {
        Value result = Value::array();
        for (const auto& elem : val) {
            result.push_back(strip_reserved_keys(elem));
        }
        return result;
    }

    return val;
}

Value deep_merge(const Value& base, const std::optional<Value>& override_val) {
    if (!override_val.has_value()) {
        return base;
    }

    // Non-object on either side: override wins
    if (!is_plain_object(base) || !is_plain_object(*override_val)) {
        return strip_reserved_keys(*override_val);
    }

    Value result = Value::object();

    for (auto it = base.begin(); it != base.end(); ++it) {
        if (is_reserved_key(it.key())) continue;
        if (override_val->contains(it.key())) continue;
        result[it.key()] = strip_reserved_keys(it.value());
    }

    for (auto it = override_val->begin(); it != override_val->end(); ++it) {
        const auto& key = it.key();
        if (is_reserved_key(key)) continue;

        auto base_it = base.find(key);
        if (base_it != base.end() && is_plain_object(*base_it) && is_plain_object(it.value())) {
            result[key] = deep_merge(*base_it, it.value());
        } else {
            result[key] = strip_reserved_keys(it.value());
        }
    }

    return result;
}

Value deep_merge_all(const std::vector<Value>& sources) {
    if (sources.empty()) {
        return Value::object();
    }

    Value result = sources[0];
    for (size_t i = 1; i < sources.size(); ++i) {
        result = deep_merge(result, sources[i]);
    }

    return result;
}

Config merge_configs(const Config& base, const Config& override_cfg, const std::string& context) {
    Value merged = deep_merge(Value(base), Value(override_cfg));
    auto result = validate_config(merged);
    if (!result.ok()) {
        throw InvalidConfig(context + ": " + format_issues(result.issues),
                            std::move(result.issues));
    }
    return std::move(*result.config);
}

} // namespace agentcfg

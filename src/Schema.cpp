/**
 * @file Schema.cpp
 * @brief Implementation of config validation
 */

#include "agentcfg/Schema.hpp"
#include "agentcfg/DotPath.hpp"

#include <sstream>

namespace agentcfg {

namespace {

std::string expected(const std::string& want, const Value& got) {
    return "Expected " + want + ", received " + type_name(got);
}

std::optional<ModelBinding> validate_binding(const Value& entry,
                                             const std::vector<std::string>& where,
                                             std::vector<ValidationIssue>& issues) {
    if (!entry.is_object()) {
        issues.push_back({join_dot_path(where), expected("object", entry)});
        return std::nullopt;
    }

    bool valid = true;
    ModelBinding binding;

    auto model_path = where;
    model_path.push_back("model");
    auto model = entry.find("model");
    if (model == entry.end()) {
        issues.push_back({join_dot_path(model_path), "Required"});
        valid = false;
    } else if (!model->is_string()) {
        issues.push_back({join_dot_path(model_path), expected("string", *model)});
        valid = false;
    } else if (model->get_ref<const std::string&>().empty()) {
        issues.push_back({join_dot_path(model_path), "Must not be empty"});
        valid = false;
    } else {
        binding.model = model->get<std::string>();
    }

    auto variant = entry.find("variant");
    if (variant != entry.end()) {
        if (!variant->is_string()) {
            auto variant_path = where;
            variant_path.push_back("variant");
            issues.push_back({join_dot_path(variant_path), expected("string", *variant)});
            valid = false;
        } else {
            binding.variant = variant->get<std::string>();
        }
    }

    if (!valid) return std::nullopt;
    return binding;
}

std::optional<BindingMap> validate_section(const Value& raw, const char* name,
                                           bool& valid,
                                           std::vector<ValidationIssue>& issues) {
    auto it = raw.find(name);
    if (it == raw.end()) return std::nullopt;

    if (!it->is_object()) {
        issues.push_back({name, expected("object", *it)});
        valid = false;
        return std::nullopt;
    }

    BindingMap out;
    for (auto e = it->begin(); e != it->end(); ++e) {
        if (e.key().empty()) {
            issues.push_back({std::string(name) + ".", "Name must not be empty"});
            valid = false;
            continue;
        }
        auto binding = validate_binding(e.value(), {name, e.key()}, issues);
        if (!binding) {
            valid = false;
            continue;
        }
        out.emplace(e.key(), std::move(*binding));
    }
    return out;
}

} // anonymous namespace

ValidationResult validate_config(const Value& raw) {
    ValidationResult result;

    if (!raw.is_object()) {
        result.issues.push_back({"", expected("object", raw)});
        return result;
    }

    bool valid = true;
    Config cfg;
    cfg.agents = validate_section(raw, kAgentsSection, valid, result.issues);
    cfg.categories = validate_section(raw, kCategoriesSection, valid, result.issues);

    if (valid) {
        result.config = std::move(cfg);
    }
    return result;
}

std::string format_issues(const std::vector<ValidationIssue>& issues) {
    std::ostringstream oss;
    for (size_t i = 0; i < issues.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << (issues[i].path.empty() ? "(root)" : issues[i].path)
            << ": " << issues[i].message;
    }
    return oss.str();
}

Config parse_config(const Value& raw, const std::string& context) {
    auto result = validate_config(raw);
    if (!result.ok()) {
        throw InvalidConfig(context + ": " + format_issues(result.issues),
                            std::move(result.issues));
    }
    return std::move(*result.config);
}

} // namespace agentcfg

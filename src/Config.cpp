#include "agentcfg/Config.hpp"

namespace agentcfg {

std::optional<BindingMap>* Config::section(const std::string& name) {
    if (name == kAgentsSection) return &agents;
    if (name == kCategoriesSection) return &categories;
    return nullptr;
}

const std::optional<BindingMap>* Config::section(const std::string& name) const {
    if (name == kAgentsSection) return &agents;
    if (name == kCategoriesSection) return &categories;
    return nullptr;
}

std::string Config::to_json_string(int indent) const {
    Value j = *this;
    return j.dump(indent);
}

void to_json(Value& j, const ModelBinding& b) {
    j = Value::object();
    j["model"] = b.model;
    if (b.variant.has_value()) {
        j["variant"] = *b.variant;
    }
}

void from_json(const Value& j, ModelBinding& b) {
    b.model = j.at("model").get<std::string>();
    auto it = j.find("variant");
    if (it != j.end() && !it->is_null()) {
        b.variant = it->get<std::string>();
    } else {
        b.variant.reset();
    }
}

namespace {
    Value section_to_json(const BindingMap& m) {
        Value out = Value::object();
        for (const auto& [name, binding] : m) {
            out[name] = binding;
        }
        return out;
    }

    std::optional<BindingMap> section_from_json(const Value& j, const char* key) {
        auto it = j.find(key);
        if (it == j.end()) return std::nullopt;
        BindingMap m;
        for (auto e = it->begin(); e != it->end(); ++e) {
            m.emplace(e.key(), e.value().get<ModelBinding>());
        }
        return m;
    }
} // namespace

void to_json(Value& j, const Config& c) {
    j = Value::object();
    if (c.agents.has_value()) j[kAgentsSection] = section_to_json(*c.agents);
    if (c.categories.has_value()) j[kCategoriesSection] = section_to_json(*c.categories);
}

void from_json(const Value& j, Config& c) {
    c.agents = section_from_json(j, kAgentsSection);
    c.categories = section_from_json(j, kCategoriesSection);
}

std::string describe(const ModelBinding& b) {
    if (b.variant.has_value() && !b.variant->empty()) {
        return b.model + " (" + *b.variant + ")";
    }
    return b.model;
}

} // namespace agentcfg

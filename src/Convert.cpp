/**
 * @file Convert.cpp
 * @brief Config <-> TOML conversion using toml++
 */

#include "agentcfg/Convert.hpp"
#include "agentcfg/DotPath.hpp"
#include "agentcfg/Errors.hpp"
#include "agentcfg/Loader.hpp"
#include "agentcfg/Schema.hpp"
#include "agentcfg/Util.hpp"

#include <toml++/toml.hpp>

#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace agentcfg {

namespace {

toml::table binding_table(const ModelBinding& binding) {
    toml::table tbl;
    tbl.insert("model", binding.model);
    if (binding.variant) {
        tbl.insert("variant", *binding.variant);
    }
    return tbl;
}

const char* toml_type_name(toml::node_type type) {
    switch (type) {
        case toml::node_type::integer:        return "integer";
        case toml::node_type::floating_point: return "floating-point";
        case toml::node_type::boolean:        return "boolean";
        case toml::node_type::date:           return "date";
        case toml::node_type::time:           return "time";
        case toml::node_type::date_time:      return "date-time";
        case toml::node_type::array:          return "array";
        default:                              return "unknown";
    }
}

/**
 * @brief Copy a TOML table into a JSON object, keeping only tables and
 *        strings. Everything else becomes an issue at its dotted path.
 */
Value table_to_value(const toml::table& tbl, std::vector<std::string>& path,
                     std::vector<ValidationIssue>& issues) {
    Value obj = Value::object();
    for (const auto& [key, node] : tbl) {
        const std::string name(key.str());
        path.push_back(name);
        if (const auto* child = node.as_table()) {
            obj[name] = table_to_value(*child, path, issues);
        } else if (const auto* str = node.as_string()) {
            obj[name] = str->get();
        } else {
            issues.push_back({join_dot_path(path),
                              std::string("Expected string or table, received ") +
                                  toml_type_name(node.type())});
        }
        path.pop_back();
    }
    return obj;
}

} // anonymous namespace

FileFormat format_from_path(const std::string& path) {
    const std::string ext = to_lower(std::filesystem::path(path).extension().string());
    return ext == ".toml" ? FileFormat::Toml : FileFormat::Json;
}

FileFormat parse_format(const std::string& name) {
    const std::string lower = to_lower(name);
    if (lower == "json") return FileFormat::Json;
    if (lower == "toml") return FileFormat::Toml;
    throw std::invalid_argument("Unsupported format: " + name + " (expected json or toml)");
}

std::string config_to_toml(const Config& cfg) {
    toml::table root;
    for (const char* name : {kAgentsSection, kCategoriesSection}) {
        const auto& section = *cfg.section(name);
        if (!section) continue;

        toml::table entries;
        for (const auto& [entry, binding] : *section) {
            entries.insert(entry, binding_table(binding));
        }
        root.insert(name, std::move(entries));
    }

    std::ostringstream oss;
    oss << root;
    return oss.str();
}

Config config_from_toml(const std::string& content, const std::string& path) {
    toml::table table;
    try {
        table = toml::parse(content, path);
    } catch (const toml::parse_error& e) {
        std::ostringstream oss;
        oss << "Malformed TOML in " << path
            << " (line " << e.source().begin.line
            << ", column " << e.source().begin.column << "): "
            << e.description();
        throw InvalidConfig(oss.str());
    }

    std::vector<std::string> path_segments;
    std::vector<ValidationIssue> issues;
    Value raw = table_to_value(table, path_segments, issues);
    if (!issues.empty()) {
        throw InvalidConfig(path + ": " + format_issues(issues), std::move(issues));
    }
    return parse_config(raw, path);
}

Config load_config_file(const std::string& path, FileFormat format) {
    const std::string content = read_text_file(path);
    if (format == FileFormat::Toml) {
        return config_from_toml(content, path);
    }
    return parse_config(parse_json_text(content, path), path);
}

std::string dump_config(const Config& cfg, FileFormat format) {
    if (format == FileFormat::Toml) {
        return config_to_toml(cfg) + "\n";
    }
    return Value(cfg).dump(2) + "\n";
}

} // namespace agentcfg

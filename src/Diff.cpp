/**
 * @file Diff.cpp
 * @brief Implementation of config diffing
 */

#include "agentcfg/Diff.hpp"
#include "agentcfg/DotPath.hpp"

#include <algorithm>
#include <set>
#include <sstream>

namespace agentcfg {

const char* diff_type_name(DiffType type) {
    switch (type) {
        case DiffType::Add: return "add";
        case DiffType::Remove: return "remove";
        case DiffType::Modify: return "modify";
    }
    return "unknown";
}

bool operator==(const DiffEntry& a, const DiffEntry& b) {
    return a.type == b.type && a.path == b.path &&
           a.old_value == b.old_value && a.new_value == b.new_value;
}

namespace {

void diff_section(const std::optional<BindingMap>& old_map,
                  const std::optional<BindingMap>& new_map,
                  const std::string& section,
                  std::vector<DiffEntry>& entries) {
    static const BindingMap empty;
    const BindingMap& before = old_map ? *old_map : empty;
    const BindingMap& after = new_map ? *new_map : empty;

    std::set<std::string> names;
    for (const auto& [name, _] : before) names.insert(name);
    for (const auto& [name, _] : after) names.insert(name);

    for (const auto& name : names) {
        auto o = before.find(name);
        auto n = after.find(name);
        const std::string path = join_dot_path({section, name});

        if (o == before.end()) {
            entries.push_back({DiffType::Add, path, std::nullopt, n->second});
        } else if (n == after.end()) {
            entries.push_back({DiffType::Remove, path, o->second, std::nullopt});
        } else if (o->second != n->second) {
            entries.push_back({DiffType::Modify, path, o->second, n->second});
        }
    }
}

std::string format_value(const std::optional<ModelBinding>& b) {
    return b ? describe(*b) : "none";
}

} // anonymous namespace

std::vector<DiffEntry> generate_diff(const Config& old_cfg, const Config& new_cfg) {
    std::vector<DiffEntry> entries;

    diff_section(old_cfg.agents, new_cfg.agents, kAgentsSection, entries);
    diff_section(old_cfg.categories, new_cfg.categories, kCategoriesSection, entries);

    std::sort(entries.begin(), entries.end(),
              [](const DiffEntry& a, const DiffEntry& b) { return a.path < b.path; });
    return entries;
}

std::string format_diff(const std::vector<DiffEntry>& entries) {
    if (entries.empty()) {
        return "No changes detected.";
    }

    std::ostringstream oss;
    for (size_t i = 0; i < entries.size(); ++i) {
        const auto& e = entries[i];
        if (i > 0) oss << '\n';
        switch (e.type) {
            case DiffType::Add:
                oss << "+ " << e.path << ": " << format_value(e.new_value);
                break;
            case DiffType::Remove:
                oss << "- " << e.path << ": " << format_value(e.old_value);
                break;
            case DiffType::Modify:
                oss << "~ " << e.path << ": " << format_value(e.old_value)
                    << " -> " << format_value(e.new_value);
                break;
        }
    }
    return oss.str();
}

Value diff_to_json(const std::vector<DiffEntry>& entries) {
    Value out = Value::array();
    for (const auto& e : entries) {
        Value j = Value::object();
        j["type"] = diff_type_name(e.type);
        j["path"] = e.path;
        if (e.old_value) j["old"] = *e.old_value;
        if (e.new_value) j["new"] = *e.new_value;
        out.push_back(std::move(j));
    }
    return out;
}

std::string format_diff_json(const std::vector<DiffEntry>& entries) {
    return diff_to_json(entries).dump(2);
}

DiffSummary summarize_diff(const std::vector<DiffEntry>& entries) {
    DiffSummary summary;
    for (const auto& e : entries) {
        switch (e.type) {
            case DiffType::Add: ++summary.adds; break;
            case DiffType::Modify: ++summary.modifies; break;
            case DiffType::Remove: ++summary.removes; break;
        }
    }
    return summary;
}

} // namespace agentcfg

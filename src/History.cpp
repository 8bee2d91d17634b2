/**
 * @file History.cpp
 * @brief Backup-to-backup diffs
 */

#include "agentcfg/History.hpp"
#include "agentcfg/Defaults.hpp"
#include "agentcfg/Loader.hpp"
#include "agentcfg/Util.hpp"

#include <algorithm>
#include <sstream>

namespace agentcfg {

namespace {

constexpr std::size_t kChangesShown = 5;

std::string model_or_none(const std::optional<ModelBinding>& binding) {
    if (!binding || binding->model.empty()) return "none";
    return binding->model;
}

std::string format_summary(const HistoryEntry& entry) {
    if (entry.initial) {
        return "Initial config (from defaults)";
    }
    std::vector<std::string> parts;
    if (entry.summary.adds > 0) parts.push_back(std::to_string(entry.summary.adds) + " added");
    if (entry.summary.modifies > 0) parts.push_back(std::to_string(entry.summary.modifies) + " modified");
    if (entry.summary.removes > 0) parts.push_back(std::to_string(entry.summary.removes) + " removed");
    if (parts.empty()) {
        return "No changes";
    }
    std::string out = parts[0];
    for (std::size_t i = 1; i < parts.size(); ++i) out += ", " + parts[i];
    return out;
}

} // anonymous namespace

std::vector<HistoryEntry> build_history(const std::vector<BackupInfo>& backups) {
    std::vector<BackupInfo> sorted = backups;
    std::sort(sorted.begin(), sorted.end(),
              [](const BackupInfo& a, const BackupInfo& b) { return a.timestamp < b.timestamp; });

    std::vector<HistoryEntry> history;
    Config previous = default_config();
    bool first = true;

    for (const auto& backup : sorted) {
        Config current = load_config(backup.path);

        HistoryEntry entry;
        entry.timestamp = backup.timestamp;
        entry.created = backup.created;
        entry.changes = generate_diff(previous, current);
        entry.summary = summarize_diff(entry.changes);
        entry.initial = first && !entry.changes.empty();
        history.push_back(std::move(entry));

        previous = std::move(current);
        first = false;
    }

    std::reverse(history.begin(), history.end());
    return history;
}

std::vector<HistoryEntry> config_history(const std::string& config_path,
                                         std::optional<std::size_t> limit) {
    auto backups = list_backups(config_path);
    if (limit && *limit > 0 && backups.size() > *limit) {
        backups.resize(*limit);
    }
    return build_history(backups);
}

std::string format_history(const std::vector<HistoryEntry>& entries, std::size_t total_backups) {
    if (entries.empty()) {
        return "No backups found.";
    }

    std::ostringstream oss;
    for (const auto& entry : entries) {
        oss << entry.timestamp << " (" << format_file_time(entry.created) << ")\n";
        oss << "  Changes: " << format_summary(entry) << "\n";

        const std::size_t shown = std::min(entry.changes.size(), kChangesShown);
        for (std::size_t i = 0; i < shown; ++i) {
            const auto& change = entry.changes[i];
            switch (change.type) {
                case DiffType::Add:
                    oss << "  + " << change.path << ": (none) -> " << model_or_none(change.new_value);
                    break;
                case DiffType::Remove:
                    oss << "  - " << change.path << ": " << model_or_none(change.old_value) << " -> (none)";
                    break;
                case DiffType::Modify:
                    oss << "  ~ " << change.path << ": " << model_or_none(change.old_value)
                        << " -> " << model_or_none(change.new_value);
                    break;
            }
            oss << "\n";
        }
        if (entry.changes.size() > kChangesShown) {
            oss << "  ... and " << entry.changes.size() - kChangesShown << " more changes\n";
        }
        oss << "\n";
    }
    oss << "Total backups: " << total_backups;
    return oss.str();
}

Value history_to_json(const std::vector<HistoryEntry>& entries) {
    Value out = Value::array();
    for (const auto& entry : entries) {
        out.push_back({
            {"timestamp", entry.timestamp},
            {"created", format_file_time(entry.created)},
            {"changes", {
                {"added", entry.summary.adds},
                {"modified", entry.summary.modifies},
                {"removed", entry.summary.removes},
            }},
            {"details", diff_to_json(entry.changes)},
        });
    }
    return out;
}

} // namespace agentcfg

/**
 * @file History.hpp
 * @brief Change history reconstructed from backups
 *
 * Each backup is compared with the one taken before it; the oldest is
 * compared with the built-in defaults.
 */

#ifndef AGENTCFG_HISTORY_HPP
#define AGENTCFG_HISTORY_HPP

#include "agentcfg/Backup.hpp"
#include "agentcfg/Diff.hpp"
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace agentcfg {

struct HistoryEntry {
    std::string timestamp;
    std::filesystem::file_time_type created;
    DiffSummary summary;
    std::vector<DiffEntry> changes;

    /// Oldest backup that differs from the defaults
    bool initial = false;
};

/**
 * @brief Diff each backup against its predecessor.
 *
 * @param backups Backups in any order
 * @return Entries newest first
 * @throws InvalidConfig if a backup does not parse or validate
 */
std::vector<HistoryEntry> build_history(const std::vector<BackupInfo>& backups);

/**
 * @brief History of a config file's newest backups.
 *
 * @param limit Only consider this many of the newest backups
 */
std::vector<HistoryEntry> config_history(const std::string& config_path,
                                         std::optional<std::size_t> limit = std::nullopt);

/**
 * @brief Human-readable history listing.
 *
 * Shows at most five changes per backup.
 *
 * @param total_backups Count printed on the last line
 */
std::string format_history(const std::vector<HistoryEntry>& entries, std::size_t total_backups);

/**
 * @brief JSON array of {timestamp, created, changes, details}.
 */
Value history_to_json(const std::vector<HistoryEntry>& entries);

} // namespace agentcfg

#endif // AGENTCFG_HISTORY_HPP

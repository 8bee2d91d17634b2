/**
 * @file Backup.hpp
 * @brief Timestamped snapshots of the config file
 *
 * Backups live next to the config as "<config>.backup.<YYYYMMDD-HHMMSS>"
 * (UTC). Timestamps sort lexicographically in creation order.
 */

#ifndef AGENTCFG_BACKUP_HPP
#define AGENTCFG_BACKUP_HPP

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace agentcfg {

struct WriteRequest;

inline constexpr std::size_t kDefaultBackupRetention = 10;

struct BackupInfo {
    std::string timestamp;
    std::string path;
    std::filesystem::file_time_type created;
};

/**
 * @brief Format a point in time as a backup timestamp (UTC).
 */
std::string backup_timestamp(std::chrono::system_clock::time_point when);

/**
 * @brief Path of the backup for a given timestamp.
 */
std::string backup_path(const std::string& config_path, const std::string& timestamp);

/**
 * @brief Copy the config file to a new timestamped backup.
 *
 * A backup taken in the same second as an existing one replaces it.
 *
 * @return Path of the backup file
 * @throws FileNotFoundError if the config file does not exist
 * @throws PermissionDenied / std::filesystem::filesystem_error on I/O failure
 */
std::string create_backup(const std::string& config_path,
                          std::chrono::system_clock::time_point when = std::chrono::system_clock::now());

/**
 * @brief Backups of a config file, newest first.
 *
 * A missing config directory yields an empty list.
 */
std::vector<BackupInfo> list_backups(const std::string& config_path);

/**
 * @brief Atomically replace the config with a backup's content.
 *
 * @throws BackupNotFound if no backup has that timestamp
 */
void restore_backup(const std::string& config_path, const std::string& timestamp);

/**
 * @brief Delete all but the newest max_count backups.
 *
 * @return Number of backups removed
 */
std::size_t cleanup_old_backups(const std::string& config_path,
                                std::size_t max_count = kDefaultBackupRetention);

/**
 * @brief Back up the current file, then save a new config over it.
 *
 * The mtime fence is checked before anything is written, so a stale
 * request leaves no backup behind. If the save itself fails, the backup
 * taken for it is removed again. Old backups beyond max_count are pruned
 * after a successful save.
 *
 * @return Path of the backup taken, or nullopt if the file did not exist
 * @throws ConcurrentModificationError if the file changed after expected_mtime
 * @throws PermissionDenied / std::filesystem::filesystem_error on I/O failure
 */
std::optional<std::string> save_with_backup(const WriteRequest& request,
                                            std::size_t max_count = kDefaultBackupRetention);

} // namespace agentcfg

#endif // AGENTCFG_BACKUP_HPP

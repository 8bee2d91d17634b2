#include "agentcfg/Backup.hpp"
#include "agentcfg/Errors.hpp"
#include "agentcfg/Loader.hpp"
#include "agentcfg/Log.hpp"
#include "agentcfg/Writer.hpp"

#include <algorithm>
#include <ctime>

namespace fs = std::filesystem;

namespace agentcfg {

namespace {

constexpr const char* kBackupInfix = ".backup.";

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

} // anonymous namespace

std::string backup_timestamp(std::chrono::system_clock::time_point when) {
    const std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm utc{};
    gmtime_r(&t, &utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d-%H%M%S", &utc);
    return buf;
}

std::string backup_path(const std::string& config_path, const std::string& timestamp) {
    return config_path + kBackupInfix + timestamp;
}

std::string create_backup(const std::string& config_path,
                          std::chrono::system_clock::time_point when) {
    std::error_code ec;
    if (!fs::exists(config_path, ec)) {
        if (ec && ec != std::errc::no_such_file_or_directory) {
            throw_file_error(ec, config_path, "read");
        }
        throw FileNotFoundError(config_path);
    }

    const std::string dest = backup_path(config_path, backup_timestamp(when));
    fs::copy_file(config_path, dest, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw_file_error(ec, dest, "write");
    }

    logger()->info("Backed up {} to {}", config_path, dest);
    return dest;
}

std::vector<BackupInfo> list_backups(const std::string& config_path) {
    const fs::path config(config_path);
    const fs::path dir = config.parent_path().empty() ? fs::path(".") : config.parent_path();
    const std::string prefix = config.filename().string() + kBackupInfix;

    std::vector<BackupInfo> backups;

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory) {
            return backups;
        }
        throw_file_error(ec, dir.string(), "read");
    }

    for (const auto& entry : it) {
        const std::string name = entry.path().filename().string();
        if (!starts_with(name, prefix)) continue;

        BackupInfo info;
        info.timestamp = name.substr(prefix.size());
        info.path = entry.path().string();
        std::error_code time_ec;
        info.created = fs::last_write_time(entry.path(), time_ec);
        if (time_ec) {
            logger()->debug("Skipping backup {}: {}", info.path, time_ec.message());
            continue;
        }
        backups.push_back(std::move(info));
    }

    std::sort(backups.begin(), backups.end(),
              [](const BackupInfo& a, const BackupInfo& b) { return a.timestamp > b.timestamp; });
    return backups;
}

void restore_backup(const std::string& config_path, const std::string& timestamp) {
    const std::string source = backup_path(config_path, timestamp);
    std::string content;
    try {
        content = read_text_file(source);
    } catch (const FileNotFoundError&) {
        throw BackupNotFound(source);
    }

    atomic_write(config_path, content);
    logger()->info("Restored {} from {}", config_path, source);
}

std::size_t cleanup_old_backups(const std::string& config_path, std::size_t max_count) {
    auto backups = list_backups(config_path);
    if (backups.size() <= max_count) {
        return 0;
    }

    std::size_t removed = 0;
    for (auto it = backups.begin() + static_cast<std::ptrdiff_t>(max_count); it != backups.end(); ++it) {
        std::error_code ec;
        fs::remove(it->path, ec);
        if (ec) {
            throw_file_error(ec, it->path, "delete");
        }
        logger()->debug("Removed old backup {}", it->path);
        ++removed;
    }
    return removed;
}

std::optional<std::string> save_with_backup(const WriteRequest& request, std::size_t max_count) {
    check_unmodified(request.file_path, request.expected_mtime);

    std::optional<std::string> backup;
    bool replaced_backup = false;
    if (get_file_mtime(request.file_path).has_value()) {
        const auto now = std::chrono::system_clock::now();
        std::error_code ec;
        replaced_backup = fs::exists(backup_path(request.file_path, backup_timestamp(now)), ec);
        backup = create_backup(request.file_path, now);
    }

    try {
        save_config(request);
    } catch (const std::exception&) {
        // A backup file that predates this call is left in place.
        if (backup && !replaced_backup) {
            std::error_code ec;
            fs::remove(*backup, ec);
            if (ec) {
                logger()->warn("Could not remove backup {}: {}", *backup, ec.message());
            }
        }
        throw;
    }

    cleanup_old_backups(request.file_path, max_count);
    return backup;
}

} // namespace agentcfg

/**
 * @file Writer.hpp
 * @brief Durable, atomic config writes
 *
 * Every write goes to a temporary file in the destination directory and is
 * renamed over the target, so readers see either the old or the new
 * content, never a partial file. Symbolic links are written through: the
 * link's final target is replaced and the link itself is left alone.
 */

#ifndef AGENTCFG_WRITER_HPP
#define AGENTCFG_WRITER_HPP

#include "agentcfg/Config.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace agentcfg {

/**
 * @brief Arguments to save_config()
 */
struct WriteRequest {
    /// Path to write; may be a symbolic link
    std::string file_path;

    /// Config to serialize
    Config config;

    /// mtime observed when the caller read the file. When set and the
    /// file is now strictly newer, the write is refused.
    std::optional<std::filesystem::file_time_type> expected_mtime;
};

/**
 * @brief Fail if a file changed after the caller read it.
 *
 * Symbolic links are followed. A missing file or an unset expected mtime
 * always passes.
 *
 * @throws ConcurrentModificationError if the file is strictly newer
 */
void check_unmodified(const std::string& path,
                      const std::optional<std::filesystem::file_time_type>& expected_mtime);

/**
 * @brief Persist a config as pretty-printed JSON.
 *
 * @param request Target path, config and optional mtime fence
 * @throws ConcurrentModificationError if the file changed after expected_mtime
 * @throws PermissionDenied if the target or its directory is not writable
 * @throws std::filesystem::filesystem_error for other I/O failures
 */
void save_config(const WriteRequest& request);

/**
 * @brief Atomically replace a file's content.
 *
 * Creates missing parent directories. The temporary file is removed on
 * every failure path and the target is left untouched.
 *
 * @param path Destination path; symbolic links are followed
 * @param content Bytes to write
 * @throws PermissionDenied / std::filesystem::filesystem_error on failure
 */
void atomic_write(const std::string& path, const std::string& content);

/**
 * @brief Follow symbolic links to the path that should actually be written.
 *
 * Relative link targets resolve against the link's directory. A path that
 * does not exist (or a dangling link's target) is returned as is.
 *
 * @throws std::filesystem::filesystem_error on link loops or lstat failures
 */
std::string resolve_write_path(const std::string& path);

} // namespace agentcfg

#endif // AGENTCFG_WRITER_HPP

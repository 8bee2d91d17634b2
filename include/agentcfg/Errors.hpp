/**
 * @file Errors.hpp
 * @brief Exception types for agentcfg configuration errors
 *
 * Error taxonomy:
 * - ConfigError: Base class
 * - InvalidConfig: Malformed JSON or schema violations in a config file
 * - PermissionDenied: Filesystem refused a read or write
 * - ConcurrentModificationError: Target changed since the caller read it
 * - FileNotFoundError: A required file does not exist
 * - BackupNotFound: Requested backup timestamp does not exist
 * - ProfileError: Base for profile management failures
 *   - ProfileNameError, ProfileNotFound, ProfileExists, ProfileActive,
 *     DanglingSymlink
 *
 * Other I/O failures surface as std::filesystem::filesystem_error.
 */

#ifndef AGENTCFG_ERRORS_HPP
#define AGENTCFG_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include <system_error>

namespace agentcfg {

/**
 * @brief Base class for all agentcfg exceptions
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A single schema violation
 */
struct ValidationIssue {
    /// Dot-path of the offending field (empty for the root)
    std::string path;

    /// Human-readable reason
    std::string message;
};

/**
 * @brief Config file content is malformed or fails validation
 *
 * The message always starts with "Invalid configuration: ". When raised
 * for schema violations, the individual issues are available via issues().
 */
class InvalidConfig : public ConfigError {
public:
    explicit InvalidConfig(const std::string& message,
                           std::vector<ValidationIssue> issues = {})
        : ConfigError("Invalid configuration: " + message)
        , issues_(std::move(issues))
    {}

    /**
     * @brief Field-level issues (empty for parse errors)
     */
    const std::vector<ValidationIssue>& issues() const noexcept {
        return issues_;
    }

private:
    std::vector<ValidationIssue> issues_;
};

/**
 * @brief The filesystem denied access to a config file
 */
class PermissionDenied : public ConfigError {
public:
    /**
     * @brief Construct with path and attempted operation
     * @param path File that could not be accessed
     * @param operation Attempted operation ("read" or "write")
     */
    PermissionDenied(std::string path, std::string operation)
        : ConfigError("Permission denied: Cannot " + operation + " " + path +
                      ". Try running with sudo or fixing permissions.")
        , path_(std::move(path))
        , operation_(std::move(operation))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& operation() const noexcept {
        return operation_;
    }

private:
    std::string path_;
    std::string operation_;
};

/**
 * @brief The target file was modified after the caller last read it
 *
 * Raised by save_config() when the file's mtime is newer than the
 * expected mtime. Never retried internally.
 */
class ConcurrentModificationError : public ConfigError {
public:
    explicit ConcurrentModificationError(std::string path)
        : ConfigError("Concurrent modification detected for " + path +
                      ". Please try again.")
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief A file required by the operation does not exist
 */
class FileNotFoundError : public ConfigError {
public:
    explicit FileNotFoundError(std::string path)
        : ConfigError("File not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief No backup exists for the requested timestamp
 */
class BackupNotFound : public ConfigError {
public:
    explicit BackupNotFound(std::string backup_path)
        : ConfigError("Backup not found: " + backup_path)
        , path_(std::move(backup_path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Base class for profile management failures
 */
class ProfileError : public ConfigError {
public:
    using ConfigError::ConfigError;
};

/**
 * @brief Profile name fails the naming rules or is reserved
 */
class ProfileNameError : public ProfileError {
public:
    ProfileNameError(const std::string& name, const std::string& reason)
        : ProfileError("Invalid profile name \"" + name + "\": " + reason)
    {}
};

class ProfileNotFound : public ProfileError {
public:
    explicit ProfileNotFound(const std::string& name)
        : ProfileError("Profile \"" + name + "\" not found")
    {}
};

class ProfileExists : public ProfileError {
public:
    explicit ProfileExists(const std::string& name)
        : ProfileError("Profile \"" + name + "\" already exists")
    {}
};

/**
 * @brief Attempt to delete the profile the config symlink points at
 */
class ProfileActive : public ProfileError {
public:
    explicit ProfileActive(const std::string& name)
        : ProfileError("Cannot delete active profile \"" + name +
                       "\". Switch to another profile first.")
    {}
};

/**
 * @brief The config symlink points at a file that no longer exists
 */
class DanglingSymlink : public ProfileError {
public:
    explicit DanglingSymlink(const std::string& target)
        : ProfileError("Dangling symlink detected: target \"" + target +
                       "\" no longer exists. Please fix manually.")
    {}
};

/**
 * @brief Translate a failed filesystem call into the error taxonomy
 *
 * EACCES/EPERM become PermissionDenied; everything else is rethrown as
 * std::filesystem::filesystem_error carrying the original error code.
 *
 * @param ec Error code reported by the failed call
 * @param path Path the operation targeted
 * @param operation Operation name used in messages ("read", "write", ...)
 */
[[noreturn]] void throw_file_error(const std::error_code& ec,
                                   const std::string& path,
                                   const std::string& operation);

} // namespace agentcfg

#endif // AGENTCFG_ERRORS_HPP

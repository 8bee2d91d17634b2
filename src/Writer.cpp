/**
 * @file Writer.cpp
 * @brief Atomic config writing (POSIX)
 *
 * Order: resolve symlinks -> mtime fence -> create parent directories ->
 * mkstemp in the target directory -> write + fsync -> copy target mode ->
 * close -> rename over target -> fsync directory.
 */

#include "agentcfg/Writer.hpp"
#include "agentcfg/Errors.hpp"
#include "agentcfg/Loader.hpp"
#include "agentcfg/Log.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace agentcfg {

namespace {

constexpr int kMaxSymlinkHops = 40;
constexpr mode_t kNewFileMode = S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH;

std::error_code last_error() {
    return std::error_code(errno, std::generic_category());
}

/**
 * @brief Closes a file descriptor on scope exit unless released.
 */
class FdGuard {
public:
    explicit FdGuard(int fd) : fd_(fd) {}
    ~FdGuard() {
        if (fd_ >= 0) ::close(fd_);
    }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const noexcept { return fd_; }

    int release() noexcept {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

private:
    int fd_;
};

/**
 * @brief Unlinks a temporary file on scope exit unless committed.
 */
class TempFileGuard {
public:
    explicit TempFileGuard(std::string path) : path_(std::move(path)) {}
    ~TempFileGuard() {
        if (!committed_) ::unlink(path_.c_str());
    }
    TempFileGuard(const TempFileGuard&) = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;

    const std::string& path() const noexcept { return path_; }
    void commit() noexcept { committed_ = true; }

private:
    std::string path_;
    bool committed_ = false;
};

void write_all(int fd, const std::string& content, const std::string& path) {
    const char* buf = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        const ssize_t n = ::write(fd, buf, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw_file_error(last_error(), path, "write");
        }
        buf += n;
        remaining -= static_cast<size_t>(n);
    }
}

void fsync_directory(const fs::path& dir) {
    const int dfd = ::open(dir.c_str(), O_DIRECTORY | O_RDONLY);
    if (dfd < 0) {
        logger()->warn("Cannot open {} to sync: {}", dir.string(), std::strerror(errno));
        return;
    }
    FdGuard guard(dfd);
    if (::fsync(dfd) != 0) {
        logger()->warn("fsync of directory {} failed: {}", dir.string(), std::strerror(errno));
    }
}

} // anonymous namespace

std::string resolve_write_path(const std::string& path) {
    fs::path current(path);
    for (int hop = 0; hop < kMaxSymlinkHops; ++hop) {
        std::error_code ec;
        const auto st = fs::symlink_status(current, ec);
        if (st.type() == fs::file_type::not_found) {
            return current.string();
        }
        if (ec) {
            throw_file_error(ec, path, "write");
        }
        if (!fs::is_symlink(st)) {
            return current.string();
        }

        fs::path target = fs::read_symlink(current, ec);
        if (ec) {
            throw_file_error(ec, path, "write");
        }
        current = target.is_absolute() ? target : current.parent_path() / target;
        logger()->debug("{} is a symlink, writing through to {}", path, current.string());
    }
    throw_file_error(std::make_error_code(std::errc::too_many_symbolic_link_levels),
                     path, "write");
}

void atomic_write(const std::string& path, const std::string& content) {
    const fs::path target(resolve_write_path(path));
    const fs::path parent = target.parent_path().empty() ? fs::path(".") : target.parent_path();

    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        throw_file_error(ec, parent.string(), "write");
    }

    const std::string tmpl = (parent / (target.filename().string() + ".tmp.XXXXXX")).string();
    std::vector<char> tmpl_buf(tmpl.begin(), tmpl.end());
    tmpl_buf.push_back('\0');

    const int fd = ::mkstemp(tmpl_buf.data());
    if (fd < 0) {
        throw_file_error(last_error(), path, "write");
    }
    TempFileGuard temp(tmpl_buf.data());
    FdGuard file(fd);

    write_all(file.get(), content, path);

    if (::fsync(file.get()) != 0) {
        throw_file_error(last_error(), path, "write");
    }

    // Keep the existing file's permissions; new files get 0644
    struct stat target_stat;
    const mode_t mode = ::stat(target.c_str(), &target_stat) == 0
        ? static_cast<mode_t>(target_stat.st_mode & 07777)
        : kNewFileMode;
    if (::fchmod(file.get(), mode) != 0) {
        throw_file_error(last_error(), path, "write");
    }

    if (::close(file.release()) != 0) {
        throw_file_error(last_error(), path, "write");
    }

    if (std::rename(temp.path().c_str(), target.c_str()) != 0) {
        throw_file_error(last_error(), path, "write");
    }
    temp.commit();

    fsync_directory(parent);
    logger()->debug("Wrote {} bytes to {}", content.size(), target.string());
}

void check_unmodified(const std::string& path,
                      const std::optional<fs::file_time_type>& expected_mtime) {
    if (!expected_mtime.has_value()) {
        return;
    }
    const std::string target = resolve_write_path(path);
    auto actual = get_file_mtime(target);
    if (actual.has_value() && *actual > *expected_mtime) {
        logger()->debug("{} changed since it was read, refusing to overwrite", target);
        throw ConcurrentModificationError(path);
    }
}

void save_config(const WriteRequest& request) {
    check_unmodified(request.file_path, request.expected_mtime);

    const Value j = request.config;
    atomic_write(request.file_path, j.dump(2) + "\n");
}

} // namespace agentcfg

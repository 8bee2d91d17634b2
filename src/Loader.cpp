/**
 * @file Loader.cpp
 * @brief Config file loading implementation
 */

#include "agentcfg/Loader.hpp"
#include "agentcfg/Defaults.hpp"
#include "agentcfg/Errors.hpp"
#include "agentcfg/Log.hpp"
#include "agentcfg/Schema.hpp"

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace agentcfg {

std::string read_text_file(const std::string& path) {
    std::error_code dir_ec;
    if (fs::is_directory(path, dir_ec)) {
        throw_file_error(std::make_error_code(std::errc::is_a_directory), path, "read");
    }

    errno = 0;
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        const int err = errno != 0 ? errno : EIO;
        if (err == ENOENT) {
            throw FileNotFoundError(path);
        }
        throw_file_error(std::error_code(err, std::generic_category()), path, "read");
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        throw_file_error(std::make_error_code(std::errc::io_error), path, "read");
    }
    return ss.str();
}

Value parse_json_text(const std::string& content, const std::string& path) {
    try {
        return Value::parse(content);
    } catch (const Value::parse_error& e) {
        throw InvalidConfig("Malformed JSON in " + path + ": " + e.what());
    }
}

Value load_config_value(const std::string& path) {
    return parse_json_text(read_text_file(path), path);
}

Config load_config(const std::string& path) {
    std::error_code ec;
    const bool exists = fs::exists(path, ec);
    if (ec) {
        throw_file_error(ec, path, "read");
    }
    if (!exists) {
        logger()->debug("{} does not exist, using built-in defaults", path);
        return default_config();
    }

    Value raw = load_config_value(path);
    return parse_config(raw, path);
}

std::optional<fs::file_time_type> get_file_mtime(const std::string& path) {
    std::error_code ec;
    auto mtime = fs::last_write_time(path, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory) {
            return std::nullopt;
        }
        throw_file_error(ec, path, "stat");
    }
    return mtime;
}

} // namespace agentcfg

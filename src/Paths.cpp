#include "agentcfg/Paths.hpp"
#include "agentcfg/Util.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace agentcfg {

std::string project_config_path(const std::string& root) {
    return (fs::path(root) / kProjectConfigDir / kConfigFileName).string();
}

ConfigPaths resolve_config_paths(const std::string& cwd, const std::string& home) {
    ConfigPaths paths;
    paths.project_path = project_config_path(cwd);
    paths.user_path = (fs::path(home) / kUserConfigDir / kConfigFileName).string();
    return paths;
}

ConfigPaths resolve_config_paths() {
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (ec) {
        cwd = ".";
    }
    return resolve_config_paths(cwd.string(), home_directory());
}

} // namespace agentcfg

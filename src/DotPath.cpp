/**
 * @file DotPath.cpp
 * @brief Implementation of dot-path utilities
 */

#include "agentcfg/DotPath.hpp"
#include <sstream>

namespace agentcfg {

std::string join_dot_path(const std::vector<std::string>& segments) {
    if (segments.empty()) {
        return "";
    }

    std::ostringstream oss;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) oss << '.';
        oss << segments[i];
    }
    return oss.str();
}

std::pair<std::string, std::string> split_entry_path(const std::string& path) {
    auto pos = path.find('.');
    if (pos == std::string::npos) {
        return {path, ""};
    }
    return {path.substr(0, pos), path.substr(pos + 1)};
}

} // namespace agentcfg

#include "agentcfg/Errors.hpp"

#include <filesystem>

namespace agentcfg {

void throw_file_error(const std::error_code& ec,
                      const std::string& path,
                      const std::string& operation) {
    if (ec == std::errc::permission_denied ||
        ec == std::errc::operation_not_permitted) {
        throw PermissionDenied(path, operation);
    }
    throw std::filesystem::filesystem_error("Cannot " + operation, path, ec);
}

} // namespace agentcfg

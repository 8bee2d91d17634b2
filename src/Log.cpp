#include "agentcfg/Log.hpp"
#include "agentcfg/Util.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace agentcfg {

std::shared_ptr<spdlog::logger> logger() {
    static auto instance = [] {
        auto existing = spdlog::get("agentcfg");
        if (existing) return existing;
        auto created = spdlog::stderr_color_mt("agentcfg");
        created->set_pattern("[%^%l%$] %v");
        created->set_level(spdlog::level::warn);
        return created;
    }();
    return instance;
}

bool set_log_level(const std::string& level) {
    const std::string name = to_lower(level);
    auto parsed = spdlog::level::from_str(name);
    // from_str maps unknown names to off
    if (parsed == spdlog::level::off && name != "off") {
        return false;
    }
    logger()->set_level(parsed);
    return true;
}

void init_logging() {
    auto env = get_env_var(kLogLevelEnv);
    if (env.has_value() && !set_log_level(*env)) {
        logger()->warn("Ignoring unknown {} value '{}'", kLogLevelEnv, *env);
    }
}

} // namespace agentcfg

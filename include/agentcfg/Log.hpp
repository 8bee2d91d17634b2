/**
 * @file Log.hpp
 * @brief Process-wide logger
 *
 * All components log through one spdlog logger named "agentcfg" that
 * writes to stderr. The default level is warn; the CLI raises it with
 * --verbose / --log-level or the AGENTCFG_LOG_LEVEL environment variable.
 */

#ifndef AGENTCFG_LOG_HPP
#define AGENTCFG_LOG_HPP

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace agentcfg {

/// Environment variable consulted by init_logging()
inline constexpr const char* kLogLevelEnv = "AGENTCFG_LOG_LEVEL";

/**
 * @brief Shared logger, created on first use.
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Set the logger level from a spdlog level name.
 *
 * Accepts "trace", "debug", "info", "warning"/"warn", "error",
 * "critical" and "off". Unknown names leave the level unchanged.
 *
 * @return true if the name was recognized
 */
bool set_log_level(const std::string& level);

/**
 * @brief Apply the level from AGENTCFG_LOG_LEVEL, if set.
 */
void init_logging();

} // namespace agentcfg

#endif // AGENTCFG_LOG_HPP

#ifndef AGENTCFG_DEFAULTS_HPP
#define AGENTCFG_DEFAULTS_HPP

#include "agentcfg/Config.hpp"

namespace agentcfg {

/**
 * @brief Built-in configuration used when no config file exists.
 *
 * Also the baseline for `diff` and the target of `reset`.
 */
const Config& default_config();

} // namespace agentcfg

#endif // AGENTCFG_DEFAULTS_HPP

/**
 * @file logging.hpp
 * @brief Process-wide spdlog setup.
 */
#pragma once
#include "tddbatch/common/common.hpp"

#include <spdlog/spdlog.h>

namespace tddbatch
{

/// Environment variable that selects the log level.
constexpr const char* k_log_level_env = "TDDBATCH_LOG_LEVEL";

/**
 * @brief Parse a spdlog level name, case-insensitive.
 * @details Accepts trace, debug, info, warn or warning, err or error, critical
 *          and off.
 * @return The level, or std::nullopt for an unrecognized name.
 */
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name);

/**
 * @brief Install the `tddbatch` stderr logger as the spdlog default.
 *
 * @details
 * All log output goes to stderr so that stdout stays reserved for the plan
 * and the final report. The level is `fallback` unless TDDBATCH_LOG_LEVEL
 * names a valid level. Calling this more than once replaces the logger.
 */
void init_logging(spdlog::level::level_enum fallback = spdlog::level::info);

} // namespace tddbatch

/**
 * @file logging.cpp
 */
#include "tddbatch/common/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <cctype>
#include <cstdlib>

namespace tddbatch
{

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name)
{
    std::string level;
    for (char c : name)
    {
        level.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    // from_str maps every unknown name to `off`.
    const auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off")
    {
        return std::nullopt;
    }
    return parsed;
}

void init_logging(spdlog::level::level_enum fallback)
{
    spdlog::drop("tddbatch");
    auto logger = spdlog::stderr_color_mt("tddbatch");
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");

    auto level = fallback;
    if (const char* env = std::getenv(k_log_level_env))
    {
        if (auto parsed = parse_log_level(env))
        {
            level = *parsed;
        }
        else
        {
            logger->warn("ignoring unrecognized {}={}", k_log_level_env, env);
        }
    }
    logger->set_level(level);
    spdlog::set_default_logger(logger);
}

} // namespace tddbatch

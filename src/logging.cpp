// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <acp/logging.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace acp
{

std::shared_ptr<spdlog::logger> logger()
{
    static std::shared_ptr<spdlog::logger> instance = []
    {
        if (auto existing = spdlog::get(kLoggerName))
            return existing;
        return spdlog::stderr_color_mt(kLoggerName);
    }();
    return instance;
}

void set_log_level(const std::string& level)
{
    auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to off; only "off" itself may do that
    if (parsed == spdlog::level::off && level != "off")
    {
        logger()->warn("Unknown log level '{}', keeping {}", level,
                       spdlog::level::to_string_view(logger()->level()));
        return;
    }
    logger()->set_level(parsed);
}

} // namespace acp

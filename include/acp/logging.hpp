// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file logging.hpp
/// @brief The library's named spdlog logger

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace acp
{

/// Registry name of the library logger
inline constexpr const char* kLoggerName = "acp";

/// The "acp" logger
///
/// Created on first use with a stderr colour sink. A logger already registered
/// under the same name (for example by a host application with its own sinks)
/// is reused as is.
std::shared_ptr<spdlog::logger> logger();

/// Set the logger level from a name (trace, debug, info, warn, error, critical, off)
///
/// Unknown names leave the level unchanged and log a warning.
void set_log_level(const std::string& level);

} // namespace acp

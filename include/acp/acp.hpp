// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file acp.hpp
/// @brief Master include for the ACP bridge
///
/// This header includes all public API headers for convenience.
/// You can also include individual headers for finer-grained control.

#include <acp/agent_process.hpp>
#include <acp/connection.hpp>
#include <acp/correlator.hpp>
#include <acp/engine.hpp>
#include <acp/errors.hpp>
#include <acp/jsonrpc.hpp>
#include <acp/logging.hpp>
#include <acp/notification_router.hpp>
#include <acp/process.hpp>
#include <acp/reverse_handler.hpp>
#include <acp/transport.hpp>
#include <acp/transport_stdio.hpp>
#include <acp/types.hpp>

namespace acp
{

/// Library version string
inline constexpr const char* kSdkVersion = "0.1.0";

} // namespace acp

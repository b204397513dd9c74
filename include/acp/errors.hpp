// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file errors.hpp
/// @brief Failures surfaced to SessionEngine callers

#include <acp/types.hpp>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>

namespace acp
{

/// True when an agent error text points at an authentication or availability problem
inline bool is_availability_error(const std::string& message)
{
    std::string lower = message;
    std::transform(
        lower.begin(),
        lower.end(),
        lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); }
    );
    return lower.find("auth") != std::string::npos ||
           lower.find("not available") != std::string::npos ||
           lower.find("copilot cli") != std::string::npos;
}

// =============================================================================
// Base
// =============================================================================

/// Base for every failure returned to a caller
///
/// recoverable() tells UI-level retry logic whether re-issuing the call can succeed
/// (timeouts, transient agent errors) or whether user action is needed first.
class Error : public std::runtime_error
{
  public:
    explicit Error(const std::string& message, bool recoverable = true)
        : std::runtime_error(message), recoverable_(recoverable)
    {
    }

    bool recoverable() const
    {
        return recoverable_;
    }

  private:
    bool recoverable_;
};

// =============================================================================
// Specific Failures
// =============================================================================

/// The agent executable could not be located
class AgentNotFoundError : public Error
{
  public:
    explicit AgentNotFoundError(const std::string& message) : Error(message, false) {}
};

/// The agent answered a request with a JSON-RPC error object
class AgentError : public Error
{
  public:
    AgentError(int code, const std::string& message, const json& data = nullptr)
        : Error(message, !is_availability_error(message)), code_(code), data_(data)
    {
    }

    int code() const
    {
        return code_;
    }
    const json& data() const
    {
        return data_;
    }

  private:
    int code_;
    json data_;
};

/// A request exceeded its deadline
class TimeoutError : public Error
{
  public:
    explicit TimeoutError(const std::string& method)
        : Error("ACP request timed out: " + method, true), method_(method)
    {
    }

    const std::string& method() const
    {
        return method_;
    }

  private:
    std::string method_;
};

/// The agent process exited while the request was outstanding
class ProcessTerminatedError : public Error
{
  public:
    ProcessTerminatedError() : Error("ACP process terminated", false) {}
};

/// The engine was closed
class ClosedError : public Error
{
  public:
    ClosedError() : Error("ACP client is closed", false) {}
};

} // namespace acp

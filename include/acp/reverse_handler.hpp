// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file reverse_handler.hpp
/// @brief Answers requests the agent sends back to the client

#include <acp/jsonrpc.hpp>
#include <acp/types.hpp>
#include <mutex>

namespace acp
{

/// Method names of the reverse requests this client serves
namespace methods
{
inline constexpr const char* kRequestPermission = "session/request_permission";
inline constexpr const char* kReadTextFile = "fs/read_text_file";
inline constexpr const char* kWriteTextFile = "fs/write_text_file";
} // namespace methods

/// Default permission policy
///
/// Selects the first option of kind allow_once or allow_always, or the literal
/// "allow-once" when the request offers neither.
PermissionOutcome auto_approve(const PermissionRequest& request);

/// Produces exactly one response for every reverse request
class ReverseRequestHandler
{
  public:
    /// @param policy Permission policy; empty means auto_approve
    explicit ReverseRequestHandler(PermissionPolicy policy = {});

    /// Replace the permission policy; takes effect for the next request
    void set_permission_policy(PermissionPolicy policy);

    /// Build the response for a request; never throws
    JsonRpcResponse handle(const JsonRpcRequest& request);

  private:
    json request_permission(const json& params);
    json read_text_file(const json& params);
    json write_text_file(const json& params);

    std::mutex policy_mutex_;
    PermissionPolicy policy_;
};

} // namespace acp

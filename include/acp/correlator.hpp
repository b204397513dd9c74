// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file correlator.hpp
/// @brief Matching outbound requests to their responses

#include <acp/jsonrpc.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace acp
{

// =============================================================================
// Pending Request Tracking
// =============================================================================

/// Holds state for a request awaiting its response
struct PendingRequest
{
    int64_t id;
    std::string method;
    std::promise<json> promise;
    std::chrono::steady_clock::time_point created;
    std::chrono::milliseconds timeout;

    PendingRequest(int64_t request_id, std::string request_method, std::chrono::milliseconds t)
        : id(request_id), method(std::move(request_method)),
          created(std::chrono::steady_clock::now()), timeout(t)
    {
    }
};

/// Factory for the exception used to fail a batch of pending requests
using ErrorFactory = std::function<std::exception_ptr()>;

// =============================================================================
// RequestCorrelator
// =============================================================================

/// Table of in-flight requests keyed by id
///
/// Every completion path (response, timeout, stream close) removes the entry
/// under the lock before touching the promise, so each request resolves exactly
/// once and the loser of a race finds nothing to do.
class RequestCorrelator
{
  public:
    RequestCorrelator() = default;

    RequestCorrelator(const RequestCorrelator&) = delete;
    RequestCorrelator& operator=(const RequestCorrelator&) = delete;

    /// Next request id; starts at 1 and is never reused
    int64_t next_id()
    {
        return next_id_++;
    }

    /// Register a request before its frame is written
    /// @return Future completed by resolve() or fail()
    std::future<json> add(int64_t id, const std::string& method, std::chrono::milliseconds timeout);

    /// Complete the matching request with a response frame
    /// @return false if no request with that id is pending
    bool resolve(const JsonRpcResponse& response);

    /// Fail one request
    /// @return false if it was already completed
    bool fail(int64_t id, std::exception_ptr error);

    /// Fail every pending request with a fresh exception from `make_error`
    /// @return Number of requests failed
    size_t fail_all(const ErrorFactory& make_error);

    /// Block until the request completes or its timeout passes
    /// @return The response result
    /// @throws AgentError if the agent answered with an error object
    /// @throws TimeoutError on timeout; the entry is removed
    /// @throws whatever fail()/fail_all() stored
    json await(int64_t id, std::future<json>& future, std::chrono::milliseconds timeout);

    /// Number of requests in flight
    size_t size() const;

  private:
    std::shared_ptr<PendingRequest> take(int64_t id);

    std::atomic<int64_t> next_id_{1};
    mutable std::mutex mutex_;
    std::map<int64_t, std::shared_ptr<PendingRequest>> pending_;
};

} // namespace acp

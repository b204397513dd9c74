// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file connection.hpp
/// @brief JSON-RPC 2.0 connection over one agent's stdio

#include <acp/correlator.hpp>
#include <acp/jsonrpc.hpp>
#include <acp/notification_router.hpp>
#include <acp/reverse_handler.hpp>
#include <acp/transport.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace acp
{

/// Called on the read worker when the inbound stream ends
///
/// Runs on the worker thread, so it must not call Connection::stop().
using CloseHandler = std::function<void()>;

/// Bidirectional JSON-RPC connection
///
/// Features:
/// - Blocking requests correlated by id, each with its own timeout
/// - Notifications (fire-and-forget)
/// - Inbound notifications fanned out through a NotificationRouter
/// - Reverse requests answered by a ReverseRequestHandler, then observed by the router
/// - One background read worker; one write mutex for every outbound frame
class Connection
{
  public:
    /// @param transport Byte stream to the agent (takes ownership)
    /// @param router Listener registry shared with the owner
    /// @param handler Reverse request handler shared with the owner
    Connection(
        std::unique_ptr<ITransport> transport,
        std::shared_ptr<NotificationRouter> router,
        std::shared_ptr<ReverseRequestHandler> handler
    );

    ~Connection();

    // Non-copyable, non-movable (due to mutex/thread)
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
    Connection(Connection&&) = delete;
    Connection& operator=(Connection&&) = delete;

    /// Start the background read worker
    void start();

    /// Close the transport, join the worker and fail anything outstanding
    ///
    /// Pending requests fail with ProcessTerminatedError unless fail_pending()
    /// already completed them with something more specific.
    void stop();

    /// True while the read worker is consuming frames
    bool is_running() const
    {
        return running_;
    }

    /// Set the callback run when the inbound stream closes
    void set_close_handler(CloseHandler handler);

    /// Send a request and block for its result
    /// @throws AgentError, TimeoutError, ProcessTerminatedError, ClosedError
    /// @throws Error if the frame could not be written
    json request(
        const std::string& method,
        const json& params,
        std::chrono::milliseconds timeout = std::chrono::milliseconds{30000}
    );

    /// Send a notification (no response expected)
    /// @throws Error if the frame could not be written
    void notify(const std::string& method, const json& params = nullptr);

    /// Fail every pending request with a fresh error
    size_t fail_pending(const ErrorFactory& make_error);

    /// Number of requests awaiting a response
    size_t pending_count() const
    {
        return correlator_.size();
    }

  private:
    void send_message(const json& message);
    void read_loop();
    void handle_frame(Frame frame);
    void handle_request(const JsonRpcRequest& request);
    void on_stream_closed();

    std::unique_ptr<ITransport> transport_;
    LineFramer framer_;
    std::shared_ptr<NotificationRouter> router_;
    std::shared_ptr<ReverseRequestHandler> handler_;
    RequestCorrelator correlator_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};
    std::thread read_thread_;
    std::mutex write_mutex_;

    std::mutex close_mutex_;
    CloseHandler close_handler_;
};

} // namespace acp

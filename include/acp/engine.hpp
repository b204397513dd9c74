// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file engine.hpp
/// @brief SessionEngine: one agent subprocess, its connection and its session

#include <acp/agent_process.hpp>
#include <acp/connection.hpp>
#include <acp/errors.hpp>
#include <acp/notification_router.hpp>
#include <acp/reverse_handler.hpp>
#include <acp/types.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace acp
{

/// Method names of the requests this client sends
namespace methods
{
inline constexpr const char* kInitialize = "initialize";
inline constexpr const char* kSessionNew = "session/new";
inline constexpr const char* kSessionPrompt = "session/prompt";
inline constexpr const char* kSessionSetModel = "session/set_model";
inline constexpr const char* kSessionCancel = "session/cancel";
inline constexpr const char* kSessionUpdate = "session/update";
} // namespace methods

/// Build the params of the initialize request
json build_initialize_request(const EngineOptions& options);

/// Build the params of a session/prompt request
///
/// Resource blocks come first in caller order, then the text block; `model` is
/// included only when set.
json build_prompt_request(const std::string& session_id, const PromptRequest& request);

/// Parse a session/new result
/// @throws Error if the result carries no sessionId
SessionInfo parse_session_result(const json& result, const std::string& cwd);

// =============================================================================
// SessionEngine - Main entry point
// =============================================================================

/// Bridge to one external coding agent over ACP
///
/// Every operation blocks the calling thread until the agent answers. The
/// engine starts the agent on first use and restarts it transparently when a
/// call finds it dead.
///
/// Example usage:
/// @code
/// SessionEngine engine(EngineOptions::from_env());
/// auto session = engine.create_session("/path/to/project");
///
/// PromptRequest prompt;
/// prompt.session_id = session.session_id;
/// prompt.text = "Explain this project";
/// prompt.on_chunk = [](const std::string& text) { std::cout << text << std::flush; };
///
/// auto result = engine.send_prompt(prompt);
/// engine.close();
/// @endcode
class SessionEngine
{
  public:
    explicit SessionEngine(EngineOptions options = {});

    /// Destructor - runs close()
    ~SessionEngine();

    // Non-copyable, non-movable (owns unique resources)
    SessionEngine(const SessionEngine&) = delete;
    SessionEngine& operator=(const SessionEngine&) = delete;
    SessionEngine(SessionEngine&&) = delete;
    SessionEngine& operator=(SessionEngine&&) = delete;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// Locate and launch the agent and complete the initialize handshake
    ///
    /// No-op when already healthy. A dead agent is discarded first, together
    /// with its pending requests, session and model catalog.
    /// @throws AgentNotFoundError, AgentError, TimeoutError, Error, ClosedError
    void start();

    /// Shut the agent down for good
    ///
    /// Pending calls fail with ClosedError; every later call throws ClosedError.
    /// Idempotent.
    void close();

    /// Process alive, handshake complete, and not closed
    bool is_healthy() const;

    EngineState state() const
    {
        return state_.load();
    }

    // =========================================================================
    // Sessions
    // =========================================================================

    /// Create a session rooted at `cwd` ($HOME when omitted)
    SessionInfo create_session(std::optional<std::string> cwd = std::nullopt);

    /// Run one prompt turn and block until the agent ends it
    ///
    /// Streamed updates for the session are delivered to the request's callbacks
    /// on the read worker while the call is outstanding. An empty session id
    /// means the current session, which is created if needed.
    /// @return Stop reason ("unknown" if the agent gave none)
    PromptResult send_prompt(const PromptRequest& request);

    /// Ask the agent to stop the current turn of a session
    ///
    /// Fire-and-forget; the outstanding send_prompt() still waits for the agent's
    /// final answer. Never throws.
    void cancel_session(const std::string& session_id);

    /// Switch the model of a session
    void set_model(const std::string& session_id, const std::string& model_id);

    /// Models offered for the current session; creates one if none exists
    std::vector<Model> list_models();

    /// Usage multiplier of a model, "1x" when unknown
    std::string model_multiplier(const std::string& model_id) const;

    /// First authentication method advertised in the handshake, if any
    std::optional<AuthMethod> auth_method() const;

    std::optional<std::string> session_id() const;
    std::optional<std::string> current_model_id() const;

    /// Forget the current session id; the next call that needs one creates it
    ///
    /// The model catalog is kept until the agent restarts.
    void reset_session();

    // =========================================================================
    // Observation
    // =========================================================================

    /// Observe every inbound notification and answered reverse request
    ///
    /// Survives agent restarts. Listeners run on the read worker.
    Subscription on_notification(NotificationListener listener);

    /// Replace the permission policy (empty means auto_approve)
    void set_permission_policy(PermissionPolicy policy);

    /// agentInfo from the handshake (null before it)
    json agent_info() const;

    /// agentCapabilities from the handshake (null before it)
    json agent_capabilities() const;

    /// PID of the running agent, or 0
    int agent_pid() const;

  private:
    /// Throw ClosedError when closed; (re)start when unhealthy
    std::shared_ptr<Connection> ensure_started();

    bool healthy_locked() const;
    void start_locked();
    void teardown_locked(const ErrorFactory& pending_error);
    void initialize(Connection& connection);
    void on_agent_exit();

    /// Current session id, creating a session when none exists
    std::string current_session();

    std::shared_ptr<Connection> connection() const;

    EngineOptions options_;
    std::shared_ptr<NotificationRouter> router_;
    std::shared_ptr<ReverseRequestHandler> handler_;

    std::atomic<EngineState> state_{EngineState::Uninitialized};
    std::atomic<bool> closed_{false};

    // Guards the whole start/stop sequence
    mutable std::mutex lifecycle_mutex_;
    std::unique_ptr<AgentProcess> process_;
    bool initialized_ = false;

    // Guards the connection pointer, so close() can reach it during a start
    mutable std::mutex connection_mutex_;
    std::shared_ptr<Connection> connection_;

    // Session and handshake data
    mutable std::mutex data_mutex_;
    std::optional<std::string> session_id_;
    std::optional<std::vector<Model>> models_;
    std::optional<std::string> current_model_id_;
    json agent_info_;
    json agent_capabilities_;
    std::vector<AuthMethod> auth_methods_;
};

} // namespace acp

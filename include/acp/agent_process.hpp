// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file agent_process.hpp
/// @brief Locating, launching and stopping the agent subprocess

#include <acp/process.hpp>
#include <acp/types.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace acp
{

// =============================================================================
// Agent Discovery
// =============================================================================

/// Executable and arguments used to launch the agent
struct AgentCommand
{
    std::string executable;
    std::vector<std::string> args;
};

/// $HOME, or an empty string when unset
std::string home_directory();

/// Directories searched after PATH, in order
///
/// `home` is substituted for "~". Node trees under ~/.nvm/versions/node are
/// appended newest version first.
std::vector<std::string> agent_search_dirs(const std::string& home);

/// Find the agent executable
///
/// Search order: `options.agent_path`, PATH lookup of `options.agent_command`,
/// then agent_search_dirs($HOME).
/// @throws AgentNotFoundError with install instructions when nothing is found
std::string locate_agent(const EngineOptions& options);

/// Build the launch command for an agent found at `agent_path`
///
/// `<agent> --acp --stdio [--model m] [--config-dir d] [agent_args...]`. When the
/// agent sits in an nvm node tree whose bin/node exists, that node binary becomes
/// the executable and the agent its first argument.
AgentCommand build_agent_command(const std::string& agent_path, const EngineOptions& options);

// =============================================================================
// AgentProcess
// =============================================================================

/// One running agent subprocess
///
/// stdin/stdout carry the protocol; stderr is drained on a background thread and
/// logged at debug level.
///
/// Example usage:
/// @code
/// AgentProcess agent(build_agent_command(locate_agent(options), options));
/// agent.start();
/// PipeTransport transport(agent.stdin_pipe(), agent.stdout_pipe());
/// ...
/// agent.stop(std::chrono::seconds(5));
/// @endcode
class AgentProcess
{
  public:
    explicit AgentProcess(AgentCommand command, ProcessOptions options = {});
    ~AgentProcess();

    AgentProcess(const AgentProcess&) = delete;
    AgentProcess& operator=(const AgentProcess&) = delete;

    /// Spawn the subprocess
    /// @throws ProcessError if the spawn fails or the process was already started
    void start();

    /// True while the subprocess has not exited
    bool is_alive() const;

    /// Close stdin, SIGTERM, wait up to `grace`, then SIGKILL and reap
    ///
    /// Idempotent and safe before start().
    /// @return Exit code, or std::nullopt if the process was never started
    std::optional<int> stop(std::chrono::milliseconds grace = std::chrono::milliseconds{5000});

    /// Protocol output stream (agent stdin)
    WritePipe& stdin_pipe();

    /// Protocol input stream (agent stdout)
    ReadPipe& stdout_pipe();

    /// Process ID, or 0 before start()
    int pid() const;

    const AgentCommand& command() const
    {
        return command_;
    }

  private:
    void drain_stderr();

    AgentCommand command_;
    ProcessOptions options_;
    std::unique_ptr<Process> process_;

    mutable std::mutex mutex_;
    bool started_ = false;
    std::optional<int> exit_code_;

    std::atomic<bool> draining_{false};
    std::thread stderr_thread_;
};

} // namespace acp

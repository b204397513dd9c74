// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT
//
// Process management code adapted from claude-agent-sdk-cpp:
// https://github.com/0xeb/claude-agent-sdk-cpp

#pragma once

/// @file process.hpp
/// @brief POSIX child process with piped stdio, used to run the agent

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace acp
{

struct ChildState;
struct PipeFd;

/// Spawn, pipe or wait failure
class ProcessError : public std::runtime_error
{
  public:
    explicit ProcessError(const std::string& message) : std::runtime_error(message) {}
};

// =============================================================================
// Pipes
// =============================================================================

/// Parent end of a child's stdout or stderr
class ReadPipe
{
  public:
    ReadPipe();
    ~ReadPipe();

    ReadPipe(const ReadPipe&) = delete;
    ReadPipe& operator=(const ReadPipe&) = delete;

    /// Read what is available, blocking until at least one byte arrives
    /// @return Bytes read, 0 at EOF
    /// @throws ProcessError when the pipe is closed or the read fails
    size_t read(char* buffer, size_t size);

    /// Wait up to `timeout_ms` for the pipe to become readable (EOF counts)
    bool has_data(int timeout_ms = 0);

    void close();
    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeFd> fd_;
};

/// Parent end of a child's stdin
///
/// The descriptor is non-blocking, so a child that stops reading never pins a
/// writer that uses write_some().
class WritePipe
{
  public:
    WritePipe();
    ~WritePipe();

    WritePipe(const WritePipe&) = delete;
    WritePipe& operator=(const WritePipe&) = delete;

    /// Write every byte, waiting as long as the child takes to drain the pipe
    /// @throws ProcessError on a closed pipe, EPIPE or another write failure
    size_t write(const char* data, size_t size);

    /// Write as much as fits within `timeout_ms`
    /// @return Bytes written, 0 if the pipe stayed full
    /// @throws ProcessError as write()
    size_t write_some(const char* data, size_t size, int timeout_ms);

    void close();
    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeFd> fd_;
};

// =============================================================================
// Process
// =============================================================================

struct ProcessOptions
{
    /// Child working directory; empty keeps the parent's
    std::string working_directory;

    /// Added to (or overriding) the inherited environment
    std::map<std::string, std::string> environment;

    bool redirect_stdin = true;
    bool redirect_stdout = true;
    bool redirect_stderr = false;
};

/// One child process
///
/// @code
/// Process proc;
/// proc.spawn("copilot", {"--acp", "--stdio"});
/// proc.stdin_pipe().write(line.data(), line.size());
/// proc.terminate();
/// if (!proc.wait_for(std::chrono::seconds(5)))
///     proc.kill();
/// @endcode
class Process
{
  public:
    Process();
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;

    /// Start `executable` (looked up on PATH when it has no '/') with `args`
    /// @throws ProcessError if the executable cannot be found or started
    void spawn(
        const std::string& executable,
        const std::vector<std::string>& args,
        const ProcessOptions& options = {}
    );

    /// @throws ProcessError if the stream was not redirected or is closed
    WritePipe& stdin_pipe();
    ReadPipe& stdout_pipe();
    ReadPipe& stderr_pipe();

    /// False once the child has exited (the child is reaped here)
    bool is_running() const;

    /// Exit code, or std::nullopt if the child is still running after `timeout`
    std::optional<int> wait_for(std::chrono::milliseconds timeout);

    /// Block until the child exits
    int wait();

    /// SIGTERM
    void terminate();

    /// SIGKILL
    void kill();

    /// 0 before spawn()
    int pid() const;

  private:
    std::optional<int> poll_exit() const;

    std::unique_ptr<ChildState> child_;
    std::unique_ptr<WritePipe> stdin_;
    std::unique_ptr<ReadPipe> stdout_;
    std::unique_ptr<ReadPipe> stderr_;
};

/// Existing regular file with the execute bit for this user
bool is_executable(const std::string& path);

/// Resolve `name` against PATH; a name containing '/' is checked directly
std::optional<std::string> find_executable(const std::string& name);

} // namespace acp

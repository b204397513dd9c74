// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <acp/agent_process.hpp>
#include <acp/errors.hpp>
#include <acp/logging.hpp>
#include <acp/transport.hpp>
#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <mutex>

namespace fs = std::filesystem;

namespace acp
{

namespace
{

constexpr int kStderrPollMs = 100;
constexpr const char* kNvmNodeDir = "/.nvm/versions/node/";

/// Node version directories under ~/.nvm/versions/node, newest first
std::vector<std::string> nvm_bin_dirs(const std::string& home)
{
    std::vector<std::string> dirs;
    std::error_code ec;
    fs::path root = fs::path(home) / ".nvm" / "versions" / "node";
    if (home.empty() || !fs::is_directory(root, ec))
        return dirs;

    for (const auto& entry : fs::directory_iterator(root, ec))
        if (entry.is_directory(ec))
            dirs.push_back((entry.path() / "bin").string());

    std::sort(dirs.begin(), dirs.end(), std::greater<std::string>());
    return dirs;
}

/// The host must survive writes to an agent that has already exited
void ignore_sigpipe()
{
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

} // namespace

// =============================================================================
// Agent Discovery
// =============================================================================

std::string home_directory()
{
    const char* home = std::getenv("HOME");
    return home ? home : "";
}

std::vector<std::string> agent_search_dirs(const std::string& home)
{
    std::vector<std::string> dirs;
    if (!home.empty())
        dirs.push_back(home + "/.local/bin");
    dirs.push_back("/usr/local/bin");
    if (!home.empty())
    {
        dirs.push_back(home + "/.npm-global/bin");
        dirs.push_back(home + "/.yarn/bin");
    }
    dirs.push_back("/opt/homebrew/bin");

    auto nvm = nvm_bin_dirs(home);
    dirs.insert(dirs.end(), nvm.begin(), nvm.end());
    return dirs;
}

std::string locate_agent(const EngineOptions& options)
{
    if (options.agent_path)
    {
        if (!is_executable(*options.agent_path))
            throw AgentNotFoundError(
                "Agent executable not found or not executable: " + *options.agent_path
            );
        return *options.agent_path;
    }

    if (auto found = find_executable(options.agent_command))
        return *found;

    for (const auto& dir : agent_search_dirs(home_directory()))
    {
        std::string candidate = dir + "/" + options.agent_command;
        if (is_executable(candidate))
        {
            logger()->info("Found agent at {}", candidate);
            return candidate;
        }
    }

    throw AgentNotFoundError(
        "Copilot CLI not found (looked for '" + options.agent_command +
        "' on PATH and in common install directories). Install with: npm install -g "
        "@github/copilot"
    );
}

AgentCommand build_agent_command(const std::string& agent_path, const EngineOptions& options)
{
    AgentCommand command;
    command.executable = agent_path;

    auto nvm_pos = agent_path.find(kNvmNodeDir);
    if (nvm_pos != std::string::npos)
    {
        // <tree>/bin/<agent> -> <tree>/bin/node
        fs::path node = fs::path(agent_path).parent_path() / "node";
        if (is_executable(node.string()))
        {
            command.executable = node.string();
            command.args.push_back(agent_path);
        }
    }

    command.args.push_back("--acp");
    command.args.push_back("--stdio");
    if (options.model)
    {
        command.args.push_back("--model");
        command.args.push_back(*options.model);
    }
    if (options.config_dir)
    {
        command.args.push_back("--config-dir");
        command.args.push_back(*options.config_dir);
    }
    command.args.insert(command.args.end(), options.agent_args.begin(), options.agent_args.end());
    return command;
}

// =============================================================================
// AgentProcess
// =============================================================================

AgentProcess::AgentProcess(AgentCommand command, ProcessOptions options)
    : command_(std::move(command)), options_(std::move(options))
{
    options_.redirect_stdin = true;
    options_.redirect_stdout = true;
    options_.redirect_stderr = true;
}

AgentProcess::~AgentProcess()
{
    stop(std::chrono::milliseconds{2000});
}

void AgentProcess::start()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (started_)
        throw ProcessError("Agent process already started");

    ignore_sigpipe();

    auto process = std::make_unique<Process>();
    process->spawn(command_.executable, command_.args, options_);
    process_ = std::move(process);
    started_ = true;

    logger()->info("Started agent {} (pid {})", command_.executable, process_->pid());

    draining_ = true;
    stderr_thread_ = std::thread([this] { drain_stderr(); });
}

bool AgentProcess::is_alive() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return process_ && !exit_code_ && process_->is_running();
}

std::optional<int> AgentProcess::stop(std::chrono::milliseconds grace)
{
    std::unique_lock<std::mutex> lock(mutex_);
    if (!process_)
        return std::nullopt;

    if (!exit_code_)
    {
        try
        {
            process_->stdin_pipe().close();
        }
        catch (const ProcessError&)
        {
            // stdin already closed
        }
        if (process_->is_running())
            process_->terminate();

        exit_code_ = process_->wait_for(grace);
        if (!exit_code_)
        {
            logger()->warn(
                "Agent (pid {}) ignored SIGTERM for {} ms; killing",
                process_->pid(),
                grace.count()
            );
            process_->kill();
            exit_code_ = process_->wait();
        }
        logger()->info("Agent (pid {}) stopped with exit code {}", process_->pid(), *exit_code_);
    }
    lock.unlock();

    draining_ = false;
    if (stderr_thread_.joinable())
        stderr_thread_.join();
    return exit_code_;
}

WritePipe& AgentProcess::stdin_pipe()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!process_)
        throw ProcessError("Agent process not started");
    return process_->stdin_pipe();
}

ReadPipe& AgentProcess::stdout_pipe()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!process_)
        throw ProcessError("Agent process not started");
    return process_->stdout_pipe();
}

int AgentProcess::pid() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return process_ ? process_->pid() : 0;
}

void AgentProcess::drain_stderr()
{
    ReadPipe& err = process_->stderr_pipe();
    std::string pending;
    auto log_line = [](const std::string& raw)
    {
        auto line = trim(raw);
        if (!line.empty())
            logger()->debug("[agent stderr] {}", line);
    };

    // Only read what poll reports: a descendant holding stderr open without
    // finishing its line must not keep stop() waiting
    try
    {
        char buffer[1024];
        while (draining_)
        {
            if (!err.has_data(kStderrPollMs))
                continue;

            size_t n = err.read(buffer, sizeof(buffer));
            if (n == 0)
                break; // EOF
            pending.append(buffer, n);

            size_t newline;
            while ((newline = pending.find('\n')) != std::string::npos)
            {
                log_line(pending.substr(0, newline));
                pending.erase(0, newline + 1);
            }
        }
    }
    catch (const ProcessError& e)
    {
        logger()->debug("Stopped reading agent stderr: {}", e.what());
    }
    log_line(pending);
}

} // namespace acp

// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT
//
// Process management code adapted from claude-agent-sdk-cpp:
// https://github.com/0xeb/claude-agent-sdk-cpp

#include <acp/process.hpp>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <mutex>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern "C" char** environ;

namespace acp
{

struct PipeFd
{
    int fd = -1;

    ~PipeFd()
    {
        reset();
    }

    void reset()
    {
        if (fd >= 0)
            ::close(fd);
        fd = -1;
    }
};

struct ChildState
{
    pid_t pid = 0;
    bool running = false;
    int exit_code = -1;

    // Exactly one caller may reap the child
    std::mutex reap_mutex;
};

namespace
{

std::string errno_text(int err = errno)
{
    return std::strerror(err);
}

int exit_code_from(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

/// poll() one descriptor; EINTR counts as not ready
bool wait_ready(int fd, short events, int timeout_ms)
{
    pollfd entry{fd, events, 0};
    int result = ::poll(&entry, 1, timeout_ms);
    if (result < 0)
    {
        if (errno == EINTR)
            return false;
        throw ProcessError("poll failed: " + errno_text());
    }
    return result > 0;
}

void set_flag(int fd, int fd_flag, int status_flag)
{
    if (fd < 0)
        return;
    if (fd_flag)
        ::fcntl(fd, F_SETFD, ::fcntl(fd, F_GETFD) | fd_flag);
    if (status_flag)
        ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL) | status_flag);
}

/// Parent environment with `overrides` applied, as KEY=VALUE strings
std::vector<std::string> child_environment(const std::map<std::string, std::string>& overrides)
{
    std::map<std::string, std::string> merged;
    for (char** entry = environ; entry && *entry; ++entry)
    {
        std::string pair(*entry);
        auto eq = pair.find('=');
        if (eq != std::string::npos)
            merged.emplace(pair.substr(0, eq), pair.substr(eq + 1));
    }
    for (const auto& [key, value] : overrides)
        merged[key] = value;

    std::vector<std::string> result;
    result.reserve(merged.size());
    for (const auto& [key, value] : merged)
        result.push_back(key + "=" + value);
    return result;
}

std::vector<char*> c_strings(const std::vector<std::string>& strings)
{
    std::vector<char*> result;
    result.reserve(strings.size() + 1);
    for (const auto& s : strings)
        result.push_back(const_cast<char*>(s.c_str()));
    result.push_back(nullptr);
    return result;
}

/// Send errno to the parent over the exec status pipe, then exit
[[noreturn]] void fail_in_child(int status_fd)
{
    int err = errno;
    (void)!::write(status_fd, &err, sizeof(err));
    _exit(127);
}

/// dup2 `fd` onto `target` in the child and drop the original
void redirect_in_child(int fd, int target, int status_fd)
{
    if (::dup2(fd, target) < 0)
        fail_in_child(status_fd);
    ::close(fd);
}

} // namespace

// =============================================================================
// ReadPipe
// =============================================================================

ReadPipe::ReadPipe() : fd_(std::make_unique<PipeFd>()) {}

ReadPipe::~ReadPipe() = default;

size_t ReadPipe::read(char* buffer, size_t size)
{
    if (!is_open())
        throw ProcessError("Pipe is not open");

    for (;;)
    {
        ssize_t n = ::read(fd_->fd, buffer, size);
        if (n >= 0)
            return static_cast<size_t>(n);
        if (errno != EINTR)
            throw ProcessError("Read failed: " + errno_text());
    }
}

bool ReadPipe::has_data(int timeout_ms)
{
    return is_open() && wait_ready(fd_->fd, POLLIN, timeout_ms);
}

void ReadPipe::close()
{
    fd_->reset();
}

bool ReadPipe::is_open() const
{
    return fd_->fd >= 0;
}

// =============================================================================
// WritePipe
// =============================================================================

WritePipe::WritePipe() : fd_(std::make_unique<PipeFd>()) {}

WritePipe::~WritePipe() = default;

size_t WritePipe::write(const char* data, size_t size)
{
    size_t written = 0;
    while (written < size)
        written += write_some(data + written, size - written, -1);
    return written;
}

size_t WritePipe::write_some(const char* data, size_t size, int timeout_ms)
{
    if (!is_open())
        throw ProcessError("Pipe is not open");

    // POLLERR is reported when the reader is gone; write() then yields EPIPE
    if (!wait_ready(fd_->fd, POLLOUT, timeout_ms))
        return 0;

    ssize_t n = ::write(fd_->fd, data, size);
    if (n >= 0)
        return static_cast<size_t>(n);
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
        return 0;
    if (errno == EPIPE)
        throw ProcessError("Broken pipe (process closed stdin)");
    throw ProcessError("Write failed: " + errno_text());
}

void WritePipe::close()
{
    fd_->reset();
}

bool WritePipe::is_open() const
{
    return fd_->fd >= 0;
}

// =============================================================================
// Process
// =============================================================================

Process::Process()
    : child_(std::make_unique<ChildState>()), stdin_(std::make_unique<WritePipe>()),
      stdout_(std::make_unique<ReadPipe>()), stderr_(std::make_unique<ReadPipe>())
{
}

Process::~Process()
{
    stdin_->close();
    stdout_->close();
    stderr_->close();

    try
    {
        if (!is_running())
            return;
        terminate();
        if (!wait_for(std::chrono::milliseconds(2000)))
        {
            kill();
            wait();
        }
    }
    catch (const ProcessError&)
    {
        // Reaped elsewhere
    }
}

void Process::spawn(
    const std::string& executable,
    const std::vector<std::string>& args,
    const ProcessOptions& options
)
{
    // Everything the child needs is prepared here: after fork() it may only
    // call async-signal-safe functions
    std::string path = executable;
    if (executable.find('/') == std::string::npos)
    {
        auto found = find_executable(executable);
        if (!found)
            throw ProcessError("Failed to execute '" + executable + "': " + errno_text(ENOENT));
        path = *found;
    }

    std::vector<std::string> arg_strings{executable};
    arg_strings.insert(arg_strings.end(), args.begin(), args.end());
    auto argv = c_strings(arg_strings);
    auto env_strings = child_environment(options.environment);
    auto envp = c_strings(env_strings);

    // [0] read end, [1] write end
    PipeFd in[2], out[2], err[2], status[2];
    auto open_pipe = [](PipeFd (&ends)[2], const char* what)
    {
        int fds[2];
        if (::pipe(fds) != 0)
            throw ProcessError(std::string("Failed to create ") + what + " pipe: " + errno_text());
        ends[0].fd = fds[0];
        ends[1].fd = fds[1];
    };

    if (options.redirect_stdin)
        open_pipe(in, "stdin");
    if (options.redirect_stdout)
        open_pipe(out, "stdout");
    if (options.redirect_stderr)
        open_pipe(err, "stderr");
    open_pipe(status, "exec status");

    // Parent ends must not leak into this or any other child; a successful
    // exec closes the status pipe and the parent reads EOF
    set_flag(status[0].fd, FD_CLOEXEC, 0);
    set_flag(status[1].fd, FD_CLOEXEC, 0);
    set_flag(in[1].fd, FD_CLOEXEC, O_NONBLOCK);
    set_flag(out[0].fd, FD_CLOEXEC, 0);
    set_flag(err[0].fd, FD_CLOEXEC, 0);

    pid_t pid = ::fork();
    if (pid < 0)
        throw ProcessError("Failed to fork process: " + errno_text());

    if (pid == 0)
    {
        int status_fd = status[1].fd;
        if (options.redirect_stdin)
            redirect_in_child(in[0].fd, STDIN_FILENO, status_fd);
        if (options.redirect_stdout)
            redirect_in_child(out[1].fd, STDOUT_FILENO, status_fd);
        if (options.redirect_stderr)
            redirect_in_child(err[1].fd, STDERR_FILENO, status_fd);

        if (!options.working_directory.empty() && ::chdir(options.working_directory.c_str()) != 0)
            fail_in_child(status_fd);

        // SIGPIPE may be ignored by the host and ignored dispositions survive exec
        ::signal(SIGPIPE, SIG_DFL);

        ::execve(path.c_str(), argv.data(), envp.data());
        fail_in_child(status_fd);
    }

    status[1].reset();
    int child_errno = 0;
    ssize_t n;
    do
    {
        n = ::read(status[0].fd, &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);

    if (n > 0)
    {
        ::waitpid(pid, nullptr, 0);
        throw ProcessError("Failed to execute '" + executable + "': " + errno_text(child_errno));
    }

    // Child ends close when the PipeFd arrays go out of scope
    if (options.redirect_stdin)
        std::swap(stdin_->fd_->fd, in[1].fd);
    if (options.redirect_stdout)
        std::swap(stdout_->fd_->fd, out[0].fd);
    if (options.redirect_stderr)
        std::swap(stderr_->fd_->fd, err[0].fd);

    child_->pid = pid;
    child_->running = true;
    child_->exit_code = -1;
}

WritePipe& Process::stdin_pipe()
{
    if (!stdin_->is_open())
        throw ProcessError("stdin pipe not available");
    return *stdin_;
}

ReadPipe& Process::stdout_pipe()
{
    if (!stdout_->is_open())
        throw ProcessError("stdout pipe not available");
    return *stdout_;
}

ReadPipe& Process::stderr_pipe()
{
    if (!stderr_->is_open())
        throw ProcessError("stderr pipe not available");
    return *stderr_;
}

bool Process::is_running() const
{
    return child_->pid != 0 && !poll_exit();
}

std::optional<int> Process::poll_exit() const
{
    std::lock_guard<std::mutex> lock(child_->reap_mutex);
    if (child_->pid == 0 || !child_->running)
        return child_->exit_code;

    int status;
    pid_t result = ::waitpid(child_->pid, &status, WNOHANG);
    if (result == 0)
        return std::nullopt;
    if (result == child_->pid)
        child_->exit_code = exit_code_from(status);
    else if (errno != ECHILD)
        throw ProcessError("waitpid failed: " + errno_text());
    child_->running = false;
    return child_->exit_code;
}

std::optional<int> Process::wait_for(std::chrono::milliseconds timeout)
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;)
    {
        if (auto code = poll_exit())
            return code;
        if (std::chrono::steady_clock::now() >= deadline)
            return std::nullopt;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

int Process::wait()
{
    std::lock_guard<std::mutex> lock(child_->reap_mutex);
    if (child_->pid == 0 || !child_->running)
        return child_->exit_code;

    int status;
    pid_t result;
    do
    {
        result = ::waitpid(child_->pid, &status, 0);
    } while (result < 0 && errno == EINTR);

    if (result == child_->pid)
        child_->exit_code = exit_code_from(status);
    else if (errno != ECHILD)
        throw ProcessError("waitpid failed: " + errno_text());
    child_->running = false;
    return child_->exit_code;
}

void Process::terminate()
{
    if (child_->pid > 0 && child_->running)
        ::kill(child_->pid, SIGTERM);
}

void Process::kill()
{
    if (child_->pid > 0 && child_->running)
        ::kill(child_->pid, SIGKILL);
}

int Process::pid() const
{
    return static_cast<int>(child_->pid);
}

// =============================================================================
// Executable lookup
// =============================================================================

bool is_executable(const std::string& path)
{
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) && ::access(path.c_str(), X_OK) == 0;
}

std::optional<std::string> find_executable(const std::string& name)
{
    namespace fs = std::filesystem;

    if (name.find('/') != std::string::npos)
    {
        if (is_executable(name))
            return fs::absolute(name).string();
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env)
        return std::nullopt;

    std::string search(path_env);
    size_t start = 0;
    while (start <= search.size())
    {
        size_t end = search.find(':', start);
        if (end == std::string::npos)
            end = search.size();

        std::string dir = search.substr(start, end - start);
        if (!dir.empty())
        {
            auto candidate = (fs::path(dir) / name).string();
            if (is_executable(candidate))
                return candidate;
        }
        start = end + 1;
    }
    return std::nullopt;
}

} // namespace acp

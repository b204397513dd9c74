// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <acp/agent_process.hpp>
#include <acp/errors.hpp>
#include <acp/process.hpp>
#include <acp/transport.hpp>
#include <acp/transport_stdio.hpp>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <future>
#include <gtest/gtest.h>
#include <thread>
#include <unistd.h>

using namespace acp;
namespace fs = std::filesystem;

namespace
{

/// Temporary directory removed at scope exit
class TempDir
{
  public:
    TempDir()
    {
        path_ = fs::temp_directory_path() /
                ("acp_process_" + std::to_string(::getpid()) + "_" + std::to_string(counter_++));
        fs::create_directories(path_);
    }
    ~TempDir()
    {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    const fs::path& path() const
    {
        return path_;
    }

  private:
    static inline int counter_ = 0;
    fs::path path_;
};

/// Create a shell script with the execute bit set
std::string make_executable(const fs::path& path)
{
    fs::create_directories(path.parent_path());
    std::ofstream(path) << "#!/bin/sh\nexit 0\n";
    fs::permissions(
        path,
        fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec,
        fs::perm_options::replace
    );
    return path.string();
}

std::string read_all(ReadPipe& pipe, int timeout_ms = 500)
{
    std::string output;
    char buffer[256];
    while (pipe.has_data(timeout_ms))
    {
        size_t n = pipe.read(buffer, sizeof(buffer));
        if (n == 0)
            break;
        output.append(buffer, n);
    }
    return output;
}

/// Read one line (newline included) or whatever arrives before EOF or a quiet timeout
std::string read_line(ReadPipe& pipe, int timeout_ms = 5000)
{
    std::string line;
    char ch;
    while (pipe.has_data(timeout_ms) && pipe.read(&ch, 1) == 1)
    {
        line.push_back(ch);
        if (ch == '\n')
            break;
    }
    return line;
}

void write_all(WritePipe& pipe, const std::string& data)
{
    pipe.write(data.data(), data.size());
}

} // namespace

// =============================================================================
// Process Tests
// =============================================================================

TEST(ProcessTest, SpawnAndWait)
{
    Process proc;
    proc.spawn("echo", {"hello"});

    EXPECT_EQ(proc.wait(), 0);
}

TEST(ProcessTest, ReadStdout)
{
    Process proc;
    proc.spawn("echo", {"test output"});

    std::string output = read_all(proc.stdout_pipe());
    proc.wait();

    EXPECT_EQ(output, "test output\n");
}

TEST(ProcessTest, WriteStdin)
{
    Process proc;
    proc.spawn("cat", {});

    write_all(proc.stdin_pipe(), "hello world\n");
    proc.stdin_pipe().close(); // Signal EOF

    std::string output = read_all(proc.stdout_pipe());
    EXPECT_EQ(proc.wait(), 0);
    EXPECT_EQ(output, "hello world\n");
}

TEST(ProcessTest, ProcessPid)
{
    Process proc;
    EXPECT_EQ(proc.pid(), 0);

    proc.spawn("echo", {"pid test"});
    EXPECT_GT(proc.pid(), 0);

    proc.wait();
}

TEST(ProcessTest, IsRunning)
{
    Process proc;
    proc.spawn("sleep", {"0.5"});

    EXPECT_TRUE(proc.is_running());
    proc.wait();
    EXPECT_FALSE(proc.is_running());
}

TEST(ProcessTest, ExitCodeIsKeptAfterReaping)
{
    Process proc;
    proc.spawn("sh", {"-c", "exit 7"});

    auto result = proc.wait_for(std::chrono::seconds(5));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 7);

    // Reaped once; later calls report the same code
    EXPECT_EQ(proc.wait_for(std::chrono::milliseconds(0)), 7);
    EXPECT_EQ(proc.wait(), 7);
    EXPECT_FALSE(proc.is_running());
}

TEST(ProcessTest, WaitForTimesOutOnRunningProcess)
{
    Process proc;
    proc.spawn("sleep", {"100"});

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(proc.wait_for(std::chrono::milliseconds(100)).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(100));

    proc.kill();
    proc.wait();
}

TEST(ProcessTest, Terminate)
{
    Process proc;
    proc.spawn("sleep", {"100"});
    EXPECT_TRUE(proc.is_running());

    proc.terminate();
    int exit_code = proc.wait();

    EXPECT_FALSE(proc.is_running());
    EXPECT_NE(exit_code, 0);
}

TEST(ProcessTest, Kill)
{
    Process proc;
    proc.spawn("sleep", {"100"});
    EXPECT_TRUE(proc.is_running());

    proc.kill();
    proc.wait();

    EXPECT_FALSE(proc.is_running());
}

TEST(ProcessTest, Environment)
{
    Process proc;
    ProcessOptions opts;
    opts.environment["TEST_VAR"] = "test_value";

    proc.spawn("sh", {"-c", "echo $TEST_VAR"}, opts);

    std::string output = read_all(proc.stdout_pipe());
    proc.wait();

    EXPECT_EQ(output, "test_value\n");
}

TEST(ProcessTest, EnvironmentOverridesInheritedValues)
{
    ::setenv("ACP_PROCESS_KEPT", "kept", 1);
    ::setenv("ACP_PROCESS_REPLACED", "parent", 1);

    Process proc;
    ProcessOptions opts;
    opts.environment["ACP_PROCESS_REPLACED"] = "child";
    proc.spawn("sh", {"-c", "echo $ACP_PROCESS_KEPT $ACP_PROCESS_REPLACED"}, opts);

    std::string output = read_all(proc.stdout_pipe());
    proc.wait();

    EXPECT_EQ(output, "kept child\n");
    EXPECT_STREQ(std::getenv("ACP_PROCESS_REPLACED"), "parent");

    ::unsetenv("ACP_PROCESS_KEPT");
    ::unsetenv("ACP_PROCESS_REPLACED");
}

TEST(ProcessTest, WorkingDirectory)
{
    TempDir dir;
    Process proc;
    ProcessOptions opts;
    opts.working_directory = dir.path().string();

    proc.spawn("pwd", {}, opts);

    std::string output = read_all(proc.stdout_pipe());
    proc.wait();

    EXPECT_EQ(fs::canonical(trim(output)), fs::canonical(dir.path()));
}

TEST(ProcessTest, NonExistentExecutable)
{
    Process proc;
    EXPECT_THROW({ proc.spawn("this_executable_does_not_exist_12345", {}); }, ProcessError);
}

TEST(ProcessTest, ReadLine)
{
    Process proc;
    proc.spawn("sh", {"-c", "echo line1; echo line2"});

    std::string line1 = read_line(proc.stdout_pipe());
    std::string line2 = read_line(proc.stdout_pipe());
    proc.wait();

    EXPECT_EQ(line1, "line1\n");
    EXPECT_EQ(line2, "line2\n");
}

TEST(ProcessTest, UnredirectedPipeThrows)
{
    Process proc;
    ProcessOptions opts;
    opts.redirect_stdin = false;
    proc.spawn("echo", {"x"}, opts);

    EXPECT_THROW(proc.stdin_pipe(), ProcessError);
    EXPECT_THROW(proc.stderr_pipe(), ProcessError);
    proc.wait();
}

// =============================================================================
// Utility Function Tests
// =============================================================================

TEST(ProcessUtilTest, FindExecutable)
{
    auto sh = find_executable("sh");
    ASSERT_TRUE(sh.has_value());
    EXPECT_TRUE(is_executable(*sh));
}

TEST(ProcessUtilTest, FindExecutableNotFound)
{
    EXPECT_FALSE(find_executable("this_does_not_exist_xyz123").has_value());
}

TEST(ProcessUtilTest, FindExecutableWithPath)
{
    TempDir dir;
    auto script = make_executable(dir.path() / "tool");

    auto found = find_executable(script);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(fs::path(*found), fs::absolute(script));
}

TEST(ProcessUtilTest, IsExecutable)
{
    TempDir dir;
    auto script = make_executable(dir.path() / "run");
    auto plain = dir.path() / "plain.txt";
    std::ofstream(plain) << "data";

    EXPECT_TRUE(is_executable(script));
    EXPECT_FALSE(is_executable(plain.string()));
    EXPECT_FALSE(is_executable(dir.path().string()));
    EXPECT_FALSE(is_executable((dir.path() / "missing").string()));
}

// =============================================================================
// Agent Discovery Tests
// =============================================================================

TEST(AgentDiscoveryTest, ExplicitPathIsUsed)
{
    TempDir dir;
    EngineOptions options;
    options.agent_path = make_executable(dir.path() / "copilot");

    EXPECT_EQ(locate_agent(options), *options.agent_path);
}

TEST(AgentDiscoveryTest, ExplicitPathMustBeExecutable)
{
    EngineOptions options;
    options.agent_path = "/definitely/not/an/agent";

    try
    {
        locate_agent(options);
        FAIL() << "expected AgentNotFoundError";
    }
    catch (const AgentNotFoundError& e)
    {
        EXPECT_NE(std::string(e.what()).find("/definitely/not/an/agent"), std::string::npos);
        EXPECT_FALSE(e.recoverable());
    }
}

TEST(AgentDiscoveryTest, CommandFoundOnPath)
{
    EngineOptions options;
    options.agent_command = "sh";

    auto path = locate_agent(options);
    EXPECT_TRUE(is_executable(path));
    EXPECT_EQ(fs::path(path).filename(), "sh");
}

TEST(AgentDiscoveryTest, MissingAgentReportsInstallHint)
{
    EngineOptions options;
    options.agent_command = "acp-agent-that-does-not-exist-42";

    try
    {
        locate_agent(options);
        FAIL() << "expected AgentNotFoundError";
    }
    catch (const AgentNotFoundError& e)
    {
        EXPECT_NE(std::string(e.what()).find("npm install -g @github/copilot"), std::string::npos);
    }
}

TEST(AgentDiscoveryTest, SearchDirsOrder)
{
    TempDir home;
    fs::create_directories(home.path() / ".nvm/versions/node/v18.0.0/bin");
    fs::create_directories(home.path() / ".nvm/versions/node/v20.1.0/bin");

    auto dirs = agent_search_dirs(home.path().string());
    std::string h = home.path().string();

    ASSERT_EQ(dirs.size(), 7u);
    EXPECT_EQ(dirs[0], h + "/.local/bin");
    EXPECT_EQ(dirs[1], "/usr/local/bin");
    EXPECT_EQ(dirs[2], h + "/.npm-global/bin");
    EXPECT_EQ(dirs[3], h + "/.yarn/bin");
    EXPECT_EQ(dirs[4], "/opt/homebrew/bin");
    EXPECT_EQ(dirs[5], (home.path() / ".nvm/versions/node/v20.1.0/bin").string());
    EXPECT_EQ(dirs[6], (home.path() / ".nvm/versions/node/v18.0.0/bin").string());
}

TEST(AgentDiscoveryTest, SearchDirsWithoutHome)
{
    auto dirs = agent_search_dirs("");
    EXPECT_EQ(dirs, (std::vector<std::string>{"/usr/local/bin", "/opt/homebrew/bin"}));
}

TEST(AgentCommandTest, ProtocolFlagsFirst)
{
    EngineOptions options;
    auto command = build_agent_command("/usr/bin/copilot", options);

    EXPECT_EQ(command.executable, "/usr/bin/copilot");
    EXPECT_EQ(command.args, (std::vector<std::string>{"--acp", "--stdio"}));
}

TEST(AgentCommandTest, ModelConfigDirAndExtraArgs)
{
    EngineOptions options;
    options.model = "gpt-4.1";
    options.config_dir = "/tmp/cfg";
    options.agent_args = {"--verbose", "--no-color"};

    auto command = build_agent_command("/usr/bin/copilot", options);

    EXPECT_EQ(
        command.args,
        (std::vector<std::string>{
            "--acp", "--stdio", "--model", "gpt-4.1", "--config-dir", "/tmp/cfg", "--verbose", "--no-color"
        })
    );
}

TEST(AgentCommandTest, NvmAgentRunsThroughSiblingNode)
{
    TempDir home;
    auto bin = home.path() / ".nvm/versions/node/v20.1.0/bin";
    auto agent = make_executable(bin / "copilot");
    auto node = make_executable(bin / "node");

    auto command = build_agent_command(agent, EngineOptions{});

    EXPECT_EQ(command.executable, node);
    ASSERT_GE(command.args.size(), 3u);
    EXPECT_EQ(command.args[0], agent);
    EXPECT_EQ(command.args[1], "--acp");
    EXPECT_EQ(command.args[2], "--stdio");
}

TEST(AgentCommandTest, NvmAgentWithoutNodeRunsDirectly)
{
    TempDir home;
    auto agent = make_executable(home.path() / ".nvm/versions/node/v20.1.0/bin/copilot");

    auto command = build_agent_command(agent, EngineOptions{});

    EXPECT_EQ(command.executable, agent);
    EXPECT_EQ(command.args[0], "--acp");
}

// =============================================================================
// AgentProcess Tests
// =============================================================================

TEST(AgentProcessTest, StartTalkAndStop)
{
    AgentProcess agent(AgentCommand{"/bin/sh", {"-c", "echo starting >&2; cat"}});
    EXPECT_EQ(agent.pid(), 0);
    EXPECT_FALSE(agent.is_alive());

    agent.start();
    EXPECT_GT(agent.pid(), 0);
    EXPECT_TRUE(agent.is_alive());

    write_all(agent.stdin_pipe(), "ping\n");
    EXPECT_EQ(read_line(agent.stdout_pipe()), "ping\n");

    auto code = agent.stop(std::chrono::seconds(2));
    EXPECT_TRUE(code.has_value());
    EXPECT_FALSE(agent.is_alive());

    // Idempotent
    EXPECT_EQ(agent.stop(std::chrono::seconds(2)), code);
}

TEST(AgentProcessTest, StopBeforeStartIsNoop)
{
    AgentProcess agent(AgentCommand{"/bin/cat", {}});
    EXPECT_FALSE(agent.stop().has_value());
    EXPECT_THROW(agent.stdin_pipe(), ProcessError);
}

TEST(AgentProcessTest, SecondStartThrows)
{
    AgentProcess agent(AgentCommand{"/bin/cat", {}});
    agent.start();
    EXPECT_THROW(agent.start(), ProcessError);
    agent.stop(std::chrono::seconds(2));
}

TEST(AgentProcessTest, ExitedAgentIsNotAlive)
{
    AgentProcess agent(AgentCommand{"/bin/sh", {"-c", "exit 0"}});
    agent.start();

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (agent.is_alive() && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));

    EXPECT_FALSE(agent.is_alive());
    EXPECT_EQ(agent.stop(), 0);
}

TEST(AgentProcessTest, StubbornAgentIsKilledAfterGrace)
{
    // "ready" is printed only once SIGTERM is ignored; the disposition survives exec
    AgentProcess agent(
        AgentCommand{"/bin/sh", {"-c", "trap '' TERM; echo ready; exec sleep 30"}}
    );
    agent.start();
    ASSERT_EQ(read_line(agent.stdout_pipe()), "ready\n");
    ASSERT_TRUE(agent.is_alive());

    auto start = std::chrono::steady_clock::now();
    auto code = agent.stop(std::chrono::milliseconds(200));
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(code.has_value());
    EXPECT_NE(*code, 0);
    EXPECT_GE(elapsed, std::chrono::milliseconds(200));
    EXPECT_LT(elapsed, std::chrono::seconds(5));
    EXPECT_FALSE(agent.is_alive());
}

TEST(AgentProcessTest, MissingExecutableFailsToStart)
{
    AgentProcess agent(AgentCommand{"/definitely/not/here", {}});
    EXPECT_THROW(agent.start(), ProcessError);
    EXPECT_FALSE(agent.is_alive());
}

TEST(AgentProcessTest, UnfinishedStderrLineDoesNotBlockStop)
{
    // The background sleep keeps stderr open after the shell exits
    AgentProcess agent(AgentCommand{
        "/bin/sh", {"-c", "printf 'no newline' >&2; sleep 5 >/dev/null & echo ready; exec cat"}
    });
    agent.start();
    ASSERT_EQ(read_line(agent.stdout_pipe()), "ready\n");
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    auto start = std::chrono::steady_clock::now();
    auto code = agent.stop(std::chrono::seconds(1));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(code.has_value());
    EXPECT_LT(elapsed, std::chrono::seconds(3));
}

// =============================================================================
// PipeTransport Tests
// =============================================================================

TEST(PipeTransportTest, CloseReleasesWriterOnFullPipe)
{
    // The child never reads stdin
    Process proc;
    proc.spawn("sleep", {"30"});
    PipeTransport transport(proc.stdin_pipe(), proc.stdout_pipe());

    std::string frame(1 << 20, 'x');
    auto writer = std::async(
        std::launch::async, [&] { transport.write(frame.data(), frame.size()); }
    );
    EXPECT_EQ(writer.wait_for(std::chrono::milliseconds(300)), std::future_status::timeout);

    transport.close();

    ASSERT_EQ(writer.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_THROW(writer.get(), ConnectionClosedError);
    EXPECT_FALSE(transport.is_open());

    proc.kill();
    proc.wait();
}

TEST(PipeTransportTest, WriteToExitedChildFails)
{
    std::signal(SIGPIPE, SIG_IGN);

    Process proc;
    proc.spawn("sh", {"-c", "exit 0"});
    proc.wait();
    PipeTransport transport(proc.stdin_pipe(), proc.stdout_pipe());

    std::string frame = "{}\n";
    EXPECT_THROW(transport.write(frame.data(), frame.size()), TransportError);
    EXPECT_FALSE(transport.is_open());
}

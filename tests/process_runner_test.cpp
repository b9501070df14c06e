#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <thread>

#include "exec/process_runner.hpp"

using namespace chix::exec;

namespace {

// A process counts as gone once /proc has no entry for it or it is a zombie
// waiting for init.
bool IsAlive(long pid) {
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    if (!stat.is_open()) {
        return false;
    }
    std::string line;
    std::getline(stat, line);
    const auto close = line.rfind(')');
    if (close == std::string::npos || close + 2 >= line.size()) {
        return false;
    }
    return line[close + 2] != 'Z';
}

bool WaitUntilGone(long pid, std::chrono::milliseconds limit) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (!IsAlive(pid)) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return !IsAlive(pid);
}

ProcessOptions WithTimeout(std::chrono::milliseconds timeout) {
    ProcessOptions options{};
    options.timeout = timeout;
    return options;
}

}  // namespace

TEST(ProcessRunnerTest, ReportsZeroExit) {
    const auto result = ProcessRunner::Run("true", {}, ProcessOptions{});
    ASSERT_TRUE(result.exit_code.has_value());
    EXPECT_EQ(*result.exit_code, 0);
    EXPECT_TRUE(result.Succeeded());
    EXPECT_FALSE(result.ToFailure().has_value());
}

TEST(ProcessRunnerTest, ReportsNonZeroExit) {
    const auto result = ProcessRunner::Run("false", {}, ProcessOptions{});
    ASSERT_TRUE(result.exit_code.has_value());
    EXPECT_EQ(*result.exit_code, 1);
    EXPECT_FALSE(result.Succeeded());
    EXPECT_FALSE(result.timed_out);
    EXPECT_FALSE(result.ToFailure().has_value());
}

TEST(ProcessRunnerTest, CapturesStreamsSeparately) {
    const auto result = ProcessRunner::Run("/bin/sh", {"-c", "echo out; echo err >&2"}, ProcessOptions{});
    EXPECT_EQ(result.output, "out\n");
    EXPECT_EQ(result.error, "err\n");
}

TEST(ProcessRunnerTest, PassesArgumentsWithoutShell) {
    const auto result = ProcessRunner::Run("echo", {"a;b", "$HOME", "c d"}, ProcessOptions{});
    EXPECT_EQ(result.output, "a;b $HOME c d\n");
}

TEST(ProcessRunnerTest, TimeoutKillsAndReapsChild) {
    const auto started = std::chrono::steady_clock::now();
    const auto result = ProcessRunner::Run("sleep", {"30"}, WithTimeout(std::chrono::milliseconds(200)));
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_TRUE(result.timed_out);
    EXPECT_FALSE(result.exit_code.has_value());
    EXPECT_FALSE(result.Succeeded());
    ASSERT_TRUE(result.ToFailure().has_value());
    EXPECT_EQ(result.ToFailure()->code, ErrorCode::kTimeout);
    EXPECT_LT(elapsed, std::chrono::seconds(10));
    ASSERT_GT(result.pid, 0);
    EXPECT_FALSE(IsAlive(result.pid));
}

TEST(ProcessRunnerTest, TimeoutKillsGrandchildren) {
    const auto result = ProcessRunner::Run(
        "/bin/sh", {"-c", "sleep 30 & echo $!; wait"}, WithTimeout(std::chrono::milliseconds(500)));
    ASSERT_TRUE(result.timed_out);
    ASSERT_FALSE(result.output.empty());
    const long grandchild = std::stol(result.output);
    EXPECT_TRUE(WaitUntilGone(grandchild, std::chrono::seconds(2)));
}

TEST(ProcessRunnerTest, KeepsPartialOutputOnTimeout) {
    const auto result = ProcessRunner::Run(
        "/bin/sh", {"-c", "echo partial; sleep 30"}, WithTimeout(std::chrono::milliseconds(500)));
    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.output, "partial\n");
}

TEST(ProcessRunnerTest, CancellationStopsChild) {
    auto token = std::make_shared<CancellationToken>();
    ProcessOptions options = WithTimeout(std::chrono::seconds(60));
    options.cancel = token;

    std::thread canceller([token]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        token->Cancel();
    });
    const auto started = std::chrono::steady_clock::now();
    const auto result = ProcessRunner::Run("sleep", {"30"}, options);
    const auto elapsed = std::chrono::steady_clock::now() - started;
    canceller.join();

    EXPECT_TRUE(result.cancelled);
    EXPECT_FALSE(result.timed_out);
    EXPECT_FALSE(result.exit_code.has_value());
    ASSERT_TRUE(result.ToFailure().has_value());
    EXPECT_EQ(result.ToFailure()->code, ErrorCode::kCancelled);
    EXPECT_LT(elapsed, std::chrono::seconds(10));
    EXPECT_FALSE(IsAlive(result.pid));
}

TEST(ProcessRunnerTest, MissingProgramIsSpawnFailure) {
    const auto result = ProcessRunner::Run("chix-test-no-such-program", {}, ProcessOptions{});
    ASSERT_TRUE(result.spawn_error.has_value());
    EXPECT_FALSE(result.exit_code.has_value());
    ASSERT_TRUE(result.ToFailure().has_value());
    EXPECT_EQ(result.ToFailure()->code, ErrorCode::kSpawnFailed);
}

TEST(ProcessRunnerTest, BadWorkingDirectoryIsSpawnFailure) {
    ProcessOptions options{};
    options.working_dir = "/nonexistent/chix/test/dir";
    const auto result = ProcessRunner::Run("true", {}, options);
    EXPECT_TRUE(result.spawn_error.has_value());
    EXPECT_FALSE(result.Succeeded());
}

TEST(ProcessRunnerTest, AppliesEnvironmentOverrides) {
    ProcessOptions options{};
    options.env = {{"CHIX_TEST_VAR", "hello"}};
    const auto result = ProcessRunner::Run("printenv", {"CHIX_TEST_VAR"}, options);
    EXPECT_EQ(result.output, "hello\n");
    EXPECT_TRUE(result.Succeeded());
}

TEST(ProcessRunnerTest, RunsInWorkingDirectory) {
    const auto dir = std::filesystem::canonical(std::filesystem::temp_directory_path());
    ProcessOptions options{};
    options.working_dir = dir.string();
    const auto result = ProcessRunner::Run("pwd", {}, options);
    EXPECT_EQ(result.output, dir.string() + "\n");
}

TEST(ProcessRunnerTest, SignalDeathReportsShellStyleCode) {
    const auto result = ProcessRunner::Run("/bin/sh", {"-c", "kill -9 $$"}, ProcessOptions{});
    ASSERT_TRUE(result.exit_code.has_value());
    EXPECT_EQ(*result.exit_code, 128 + 9);
    EXPECT_FALSE(result.Succeeded());
}

TEST(ProcessRunnerTest, SanitizesInvalidUtf8) {
    const auto result = ProcessRunner::Run("/bin/sh", {"-c", "printf 'a\\377b'"}, ProcessOptions{});
    EXPECT_EQ(result.output, "a\xEF\xBF\xBD" "b");
}

TEST(ProcessRunnerTest, RunsCommandSpecWithContext) {
    ExecutionContext context{};
    context.env = {{"CHIX_SPEC_VAR", "from-context"}};
    const auto result = ProcessRunner::Run(CommandSpec("printenv", {"CHIX_SPEC_VAR"}), context);
    EXPECT_EQ(result.output, "from-context\n");
}

TEST(ProcessRunnerTest, UnavailableExitStatusIsFailure) {
    ProcessResult result{};
    result.status_lost = true;
    EXPECT_FALSE(result.Succeeded());
    ASSERT_TRUE(result.ToFailure().has_value());
    EXPECT_EQ(result.ToFailure()->code, ErrorCode::kSpawnFailed);
    EXPECT_EQ(result.ToFailure()->message, "exit status unavailable");
}

TEST(ProcessRunnerTest, AutoReapedChildReportsLostStatus) {
    // With SIGCHLD ignored the kernel reaps the child itself and waitpid
    // reports ECHILD.
    struct sigaction ignore {};
    struct sigaction previous {};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    ASSERT_EQ(sigaction(SIGCHLD, &ignore, &previous), 0);
    const auto result = ProcessRunner::Run("true", {}, WithTimeout(std::chrono::seconds(10)));
    sigaction(SIGCHLD, &previous, nullptr);

    EXPECT_TRUE(result.status_lost);
    EXPECT_FALSE(result.exit_code.has_value());
    EXPECT_FALSE(result.timed_out);
    ASSERT_TRUE(result.ToFailure().has_value());
    EXPECT_EQ(result.ToFailure()->code, ErrorCode::kSpawnFailed);
}

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "core/errors/runner_errors.hpp"
#include "protocol/execution_contract.hpp"
#include "runtime/process_runner.hpp"

namespace {

using coderunner::core::errors::get_error;
using coderunner::core::errors::get_value;
using coderunner::core::errors::is_error;
using coderunner::protocol::ExecutionStatus;
using coderunner::protocol::kFaultReturnCode;
using coderunner::protocol::kTimeoutReturnCode;
using coderunner::protocol::Termination;
using coderunner::runtime::ProcessRunner;

TEST(ProcessRunnerTest, CapturesStdoutAndStderrSeparately) {
    ProcessRunner runner(5);
    const std::vector<std::string> command = {
        "/bin/sh", "-c", "printf 'out'; printf 'err' >&2"};
    const auto outcome = runner.run(command);

    EXPECT_EQ(outcome.termination, Termination::Exited);
    EXPECT_EQ(outcome.status, ExecutionStatus::Success);
    EXPECT_EQ(outcome.return_code, 0);
    EXPECT_EQ(outcome.stdout_text, "out");
    EXPECT_EQ(outcome.stderr_text, "err");
    EXPECT_EQ(outcome.command, command);
}

TEST(ProcessRunnerTest, NonZeroExitIsErrorWithRealCode) {
    ProcessRunner runner(5);
    const auto outcome = runner.run({"/bin/sh", "-c", "exit 3"});

    EXPECT_EQ(outcome.termination, Termination::Exited);
    EXPECT_EQ(outcome.status, ExecutionStatus::Error);
    EXPECT_EQ(outcome.return_code, 3);
}

TEST(ProcessRunnerTest, DoesNotUseAShell) {
    ProcessRunner runner(5);
    const auto outcome = runner.run({"/bin/echo", "$HOME; echo injected"});

    EXPECT_EQ(outcome.status, ExecutionStatus::Success);
    EXPECT_EQ(outcome.stdout_text, "$HOME; echo injected\n");
}

TEST(ProcessRunnerTest, StdinIsEmpty) {
    ProcessRunner runner(5);
    const auto outcome = runner.run({"/bin/cat"});

    EXPECT_EQ(outcome.status, ExecutionStatus::Success);
    EXPECT_TRUE(outcome.stdout_text.empty());
}

TEST(ProcessRunnerTest, LargeOutputDoesNotDeadlock) {
    ProcessRunner runner(10);
    const auto outcome =
        runner.run({"/bin/sh", "-c", "head -c 1000000 /dev/zero; head -c 500000 /dev/zero >&2"});

    EXPECT_EQ(outcome.status, ExecutionStatus::Success);
    EXPECT_EQ(outcome.stdout_text.size(), 1000000u);
    EXPECT_EQ(outcome.stderr_text.size(), 500000u);
}

TEST(ProcessRunnerTest, TimesOutAndReportsSentinel) {
    ProcessRunner runner(1);
    const auto started = std::chrono::steady_clock::now();
    const auto outcome = runner.run({"/bin/sh", "-c", "echo partial; sleep 30"});
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_EQ(outcome.termination, Termination::TimedOut);
    EXPECT_EQ(outcome.status, ExecutionStatus::Error);
    EXPECT_EQ(outcome.return_code, kTimeoutReturnCode);
    EXPECT_EQ(outcome.stderr_text, "Execution timed out after 1 seconds.");
    EXPECT_TRUE(outcome.stdout_text.empty());
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST(ProcessRunnerTest, TimeoutKillsWholeProcessGroup) {
    ProcessRunner runner(1);
    const auto started = std::chrono::steady_clock::now();
    // The background sleep inherits the pipes; only a group kill lets them close.
    const auto outcome = runner.run({"/bin/sh", "-c", "sleep 30 & sleep 30; wait"});
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_EQ(outcome.termination, Termination::TimedOut);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST(ProcessRunnerTest, MissingBinaryIsAFault) {
    ProcessRunner runner(5);
    const auto outcome = runner.run({"/definitely/not/a/real/interpreter", "x.py"});

    EXPECT_EQ(outcome.termination, Termination::Faulted);
    EXPECT_EQ(outcome.status, ExecutionStatus::Error);
    EXPECT_EQ(outcome.return_code, kFaultReturnCode);
    EXPECT_NE(outcome.stderr_text.find("An unexpected error occurred during execution"),
              std::string::npos);
    EXPECT_NE(outcome.stderr_text.find("No such file or directory"), std::string::npos);
}

TEST(ProcessRunnerTest, ExitCode127FromProgramIsNotAFault) {
    ProcessRunner runner(5);
    const auto outcome = runner.run({"/bin/sh", "-c", "exit 127"});

    EXPECT_EQ(outcome.termination, Termination::Exited);
    EXPECT_EQ(outcome.return_code, 127);
}

TEST(ProcessRunnerTest, CaptureRejectsEmptyCommand) {
    ProcessRunner runner(5);
    auto result = runner.capture({});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "empty_command");

    const auto outcome = runner.run({});
    EXPECT_EQ(outcome.termination, Termination::Faulted);
    EXPECT_EQ(outcome.return_code, kFaultReturnCode);
}

TEST(ProcessRunnerTest, CaptureReportsSignalDeath) {
    ProcessRunner runner(5);
    auto result = runner.capture({"/bin/sh", "-c", "kill -9 $$"});
    ASSERT_FALSE(is_error(result));
    EXPECT_FALSE(get_value(result).timed_out);
    EXPECT_EQ(get_value(result).exit_code, 128 + 9);
}

TEST(ProcessRunnerTest, ConcurrentLongRunsDoNotDelayQuickRun) {
    std::atomic<bool> done{false};
    std::vector<std::thread> launchers;
    for (int i = 0; i < 16; ++i) {
        launchers.emplace_back([&done] {
            const ProcessRunner slow(10);
            while (!done) {
                static_cast<void>(slow.run({"sleep", "2"}));
            }
        });
    }

    const ProcessRunner quick(2);
    for (int i = 0; i < 40; ++i) {
        const auto outcome = quick.run({"echo", "hi"});
        EXPECT_EQ(outcome.termination, Termination::Exited);
        EXPECT_EQ(outcome.return_code, 0);
        EXPECT_EQ(outcome.stdout_text, "hi\n");
        EXPECT_LT(outcome.duration_ms, 1500.0);
    }

    done = true;
    for (auto& launcher : launchers) {
        launcher.join();
    }
}

}  // namespace

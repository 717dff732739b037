#include "runtime/process_runner.hpp"

#include <chrono>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>
#include "core/logging/logger.hpp"

namespace coderunner::runtime {

using core::errors::ErrorCategory;
using core::errors::RunnerError;
using protocol::ExecutionOutcome;
using protocol::ExecutionStatus;
using protocol::Termination;

namespace {

// After the group is killed, stop waiting on pipes held open by processes
// that escaped the group.
constexpr std::int64_t kKillGraceMs = 1000;

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

void close_pair(int (&fds)[2]) {
    close_fd(fds[0]);
    close_fd(fds[1]);
}

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void drain_pipe(int& fd, bool& is_open, std::string& out) {
    if (!is_open) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            is_open = false;
            close_fd(fd);
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        is_open = false;
        close_fd(fd);
        return;
    }
}

// Child side of fork(); never returns.
[[noreturn]] void exec_child(const std::vector<std::string>& command,
                             int (&stdout_pipe)[2], int (&stderr_pipe)[2],
                             int (&exec_error_pipe)[2]) {
    static_cast<void>(setpgid(0, 0));

    const int dev_null = open("/dev/null", O_RDONLY);
    if (dev_null >= 0) {
        static_cast<void>(dup2(dev_null, STDIN_FILENO));
        static_cast<void>(close(dev_null));
    }
    static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
    static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
    static_cast<void>(close(stdout_pipe[0]));
    static_cast<void>(close(stdout_pipe[1]));
    static_cast<void>(close(stderr_pipe[0]));
    static_cast<void>(close(stderr_pipe[1]));
    static_cast<void>(close(exec_error_pipe[0]));

    std::vector<char*> argv;
    argv.reserve(command.size() + 1);
    for (const auto& part : command) {
        argv.push_back(const_cast<char*>(part.c_str()));
    }
    argv.push_back(nullptr);

    execvp(argv[0], argv.data());

    // exec_error_pipe[1] is close-on-exec; reaching here means exec failed.
    const int err = errno;
    static_cast<void>(write(exec_error_pipe[1], &err, sizeof(err)));
    _exit(127);
}

// Blocks until exec succeeds (pipe closes) or the child reports errno.
int read_exec_error(const int fd) {
    int err = 0;
    while (true) {
        const ssize_t n = read(fd, &err, sizeof(err));
        if (n == static_cast<ssize_t>(sizeof(err))) {
            return err;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        return 0;
    }
}

}  // namespace

ProcessRunner::ProcessRunner(const std::uint32_t timeout_seconds)
    : timeout_seconds_(timeout_seconds) {}

std::string ProcessRunner::timeout_message() const {
    return "Execution timed out after " + std::to_string(timeout_seconds_) +
           " seconds.";
}

core::errors::Result<ProcessCapture> ProcessRunner::capture(
    const std::vector<std::string>& command) const {
    if (command.empty() || command.front().empty()) {
        return RunnerError{ErrorCategory::Internal, "Command cannot be empty.",
                           "empty_command"};
    }

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int exec_error_pipe[2] = {-1, -1};
    // Close-on-exec so children forked by concurrent runs never hold these
    // open; dup2 onto fds 1 and 2 clears the flag for our own child.
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0 || pipe2(stderr_pipe, O_CLOEXEC) != 0 ||
        pipe2(exec_error_pipe, O_CLOEXEC) != 0) {
        const int err = errno;
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(exec_error_pipe);
        return RunnerError{ErrorCategory::Internal,
                           "Failed to create process pipes: " +
                               std::generic_category().message(err),
                           "pipe_creation_failed"};
    }

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        const int err = errno;
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(exec_error_pipe);
        return RunnerError{ErrorCategory::Internal,
                           "Failed to fork process: " +
                               std::generic_category().message(err),
                           "fork_failed"};
    }

    if (pid == 0) {
        exec_child(command, stdout_pipe, stderr_pipe, exec_error_pipe);
    }

    // Mirror the child's setpgid so killpg cannot race its startup.
    static_cast<void>(setpgid(pid, pid));
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(exec_error_pipe[1]);

    const int exec_errno = read_exec_error(exec_error_pipe[0]);
    close_fd(exec_error_pipe[0]);
    if (exec_errno != 0) {
        int ignored = 0;
        static_cast<void>(waitpid(pid, &ignored, 0));
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        return RunnerError{ErrorCategory::Execution,
                           "[Errno " + std::to_string(exec_errno) + "] " +
                               std::generic_category().message(exec_errno) +
                               ": '" + command.front() + "'",
                           "exec_failed"};
    }

    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    ProcessCapture capture;
    bool stdout_open = true;
    bool stderr_open = true;
    bool child_exited = false;
    int status = 0;
    const std::int64_t timeout_ms =
        static_cast<std::int64_t>(timeout_seconds_) * 1000;
    std::int64_t killed_at_ms = -1;

    while (stdout_open || stderr_open || !child_exited) {
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - started)
                                 .count();
        if (!capture.timed_out && timeout_ms > 0 && elapsed > timeout_ms) {
            capture.timed_out = true;
            killed_at_ms = elapsed;
            static_cast<void>(kill(-pid, SIGKILL));
            if (!child_exited) {
                static_cast<void>(kill(pid, SIGKILL));
            }
        }
        if (killed_at_ms >= 0 && child_exited &&
            elapsed - killed_at_ms > kKillGraceMs) {
            break;
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_open) {
            fds[nfds].fd = stdout_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_open) {
            fds[nfds].fd = stderr_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }

        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        } else {
            static_cast<void>(poll(nullptr, 0, 10));
        }

        drain_pipe(stdout_pipe[0], stdout_open, capture.stdout_text);
        drain_pipe(stderr_pipe[0], stderr_open, capture.stderr_text);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
            } else if (waited < 0 && errno != EINTR) {
                const int err = errno;
                static_cast<void>(kill(-pid, SIGKILL));
                close_pair(stdout_pipe);
                close_pair(stderr_pipe);
                return RunnerError{ErrorCategory::Internal,
                                   "Failed to wait for process: " +
                                       std::generic_category().message(err),
                                   "wait_failed"};
            }
        }
    }
    close_pair(stdout_pipe);
    close_pair(stderr_pipe);

    if (WIFEXITED(status)) {
        capture.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        capture.exit_code = 128 + WTERMSIG(status);
    } else {
        capture.exit_code = -1;
    }

    const auto ended = std::chrono::steady_clock::now();
    capture.duration_ms =
        std::chrono::duration<double, std::milli>(ended - started).count();
    return capture;
}

ExecutionOutcome ProcessRunner::run(const std::vector<std::string>& command) const {
    ExecutionOutcome outcome;
    outcome.command = command;

    CODERUNNER_LOG_INFO("Executing command: " + protocol::join_command(command));
    auto captured = capture(command);
    if (core::errors::is_error(captured)) {
        const auto& err = core::errors::get_error(captured);
        CODERUNNER_LOG_ERROR("An unexpected error occurred during execution [" +
                             err.code + "]: " + err.message);
        outcome.status = ExecutionStatus::Error;
        outcome.termination = Termination::Faulted;
        outcome.stderr_text =
            "An unexpected error occurred during execution: " + err.message;
        outcome.return_code = protocol::kFaultReturnCode;
        return outcome;
    }

    const auto& result = core::errors::get_value(captured);
    outcome.duration_ms = result.duration_ms;
    if (result.timed_out) {
        CODERUNNER_LOG_WARN("Execution timed out after " +
                            std::to_string(timeout_seconds_) + " seconds.");
        outcome.status = ExecutionStatus::Error;
        outcome.termination = Termination::TimedOut;
        outcome.stderr_text = timeout_message();
        outcome.return_code = protocol::kTimeoutReturnCode;
        return outcome;
    }

    outcome.termination = Termination::Exited;
    outcome.stdout_text = result.stdout_text;
    outcome.stderr_text = result.stderr_text;
    outcome.return_code = result.exit_code;
    outcome.status =
        result.exit_code == 0 ? ExecutionStatus::Success : ExecutionStatus::Error;
    CODERUNNER_LOG_INFO("Execution finished with return code " +
                        std::to_string(result.exit_code) + ". Status: " +
                        protocol::to_string(outcome.status));
    return outcome;
}

}  // namespace coderunner::runtime

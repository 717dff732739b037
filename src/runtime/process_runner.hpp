#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "core/errors/runner_errors.hpp"
#include "protocol/execution_contract.hpp"

namespace coderunner::runtime {

// Raw result of one child process.
struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

// Runs an argv directly (no shell) in its own process group under a
// wall-clock ceiling. On timeout the whole group is killed.
class ProcessRunner {
public:
    explicit ProcessRunner(std::uint32_t timeout_seconds = 30);

    // Runs the command and folds every way it can end into an outcome.
    protocol::ExecutionOutcome run(const std::vector<std::string>& command) const;

    // Lower level: launch faults come back as errors, timeouts as a flag.
    core::errors::Result<ProcessCapture> capture(
        const std::vector<std::string>& command) const;

    std::uint32_t timeout_seconds() const { return timeout_seconds_; }
    std::string timeout_message() const;

private:
    std::uint32_t timeout_seconds_;
};

}  // namespace coderunner::runtime

#pragma once

#include <string>
#include <vector>

namespace coderunner::protocol {

// Reserved return codes; real exit statuses are never negative.
constexpr int kTimeoutReturnCode = -1;
constexpr int kFaultReturnCode = -2;

enum class ExecutionStatus {
    Success,
    Error
};

enum class Termination {
    Exited,
    TimedOut,
    Faulted
};

// Validated input for one /run_code call
struct ExecutionRequest {
    std::string code;
    std::string filename;
    std::string language;
};

struct ExecutionOutcome {
    ExecutionStatus status = ExecutionStatus::Error;
    Termination termination = Termination::Faulted;
    std::string stdout_text;
    std::string stderr_text;
    std::vector<std::string> command;
    int return_code = kFaultReturnCode;
    double duration_ms = 0.0;
};

inline std::string to_string(const ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::Success:
            return "success";
        case ExecutionStatus::Error:
            return "error";
        default:
            return "unknown";
    }
}

inline std::string to_string(const Termination termination) {
    switch (termination) {
        case Termination::Exited:
            return "exited";
        case Termination::TimedOut:
            return "timed_out";
        case Termination::Faulted:
            return "faulted";
        default:
            return "unknown";
    }
}

inline std::string join_command(const std::vector<std::string>& command) {
    std::string joined;
    for (const auto& part : command) {
        if (!joined.empty()) {
            joined.push_back(' ');
        }
        joined += part;
    }
    return joined;
}

}  // namespace coderunner::protocol

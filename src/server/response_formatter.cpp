#include "server/response_formatter.hpp"

namespace coderunner::server {

using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::Termination;

int status_for_error(const core::errors::RunnerError& error) {
    if (error.code == "malformed_input" || error.code == "missing_field" ||
        error.code == "path_traversal" || error.code == "unsupported_language") {
        return 400;
    }
    if (error.code == "write_failure" || error.code == "execution_fault") {
        return 500;
    }
    if (error.code == "execution_timeout") {
        return 408;
    }
    return error.category == ErrorCategory::Input ? 400 : 500;
}

int status_for_outcome(const protocol::ExecutionOutcome& outcome) {
    switch (outcome.termination) {
        case Termination::Exited:
            return 200;
        case Termination::TimedOut:
            return 408;
        case Termination::Faulted:
            return 500;
        default:
            return 500;
    }
}

HttpReply format_rejection(const core::errors::RunnerError& error) {
    HttpReply reply;
    reply.status = status_for_error(error);
    reply.body = json{{"error", error.message}};
    return reply;
}

HttpReply format_outcome(const protocol::ExecutionOutcome& outcome) {
    HttpReply reply;
    reply.status = status_for_outcome(outcome);
    reply.body = json{{"status", protocol::to_string(outcome.status)},
                      {"stdout", outcome.stdout_text},
                      {"stderr", outcome.stderr_text},
                      {"command_executed", outcome.command},
                      {"return_code", outcome.return_code}};
    return reply;
}

}  // namespace coderunner::server

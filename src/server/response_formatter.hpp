#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/runner_errors.hpp"
#include "protocol/execution_contract.hpp"

namespace coderunner::server {

// Transport-neutral HTTP answer.
struct HttpReply {
    int status = 200;
    nlohmann::json body;
};

int status_for_error(const core::errors::RunnerError& error);
int status_for_outcome(const protocol::ExecutionOutcome& outcome);

// {"error": message} with the status the error kind maps to.
HttpReply format_rejection(const core::errors::RunnerError& error);

// Full execution shape: status, stdout, stderr, command_executed, return_code.
HttpReply format_outcome(const protocol::ExecutionOutcome& outcome);

}  // namespace coderunner::server

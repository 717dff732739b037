#include <string>
#include <gtest/gtest.h>
#include "core/errors/runner_errors.hpp"
#include "protocol/execution_contract.hpp"
#include "server/response_formatter.hpp"

namespace {

using coderunner::core::errors::ErrorCategory;
using coderunner::core::errors::RunnerError;
using coderunner::protocol::ExecutionOutcome;
using coderunner::protocol::ExecutionStatus;
using coderunner::protocol::Termination;
using coderunner::server::format_outcome;
using coderunner::server::format_rejection;

TEST(ResponseFormatterTest, ValidationErrorsAreBadRequests) {
    for (const char* code :
         {"malformed_input", "missing_field", "path_traversal", "unsupported_language"}) {
        const auto reply =
            format_rejection(RunnerError{ErrorCategory::Input, "nope", code});
        EXPECT_EQ(reply.status, 400) << code;
        EXPECT_EQ(reply.body, (nlohmann::json{{"error", "nope"}}));
    }
}

TEST(ResponseFormatterTest, WriteFailureIsServerError) {
    const auto reply = format_rejection(RunnerError{
        ErrorCategory::Environment, "Failed to write code to file: denied", "write_failure"});
    EXPECT_EQ(reply.status, 500);
    EXPECT_EQ(reply.body["error"], "Failed to write code to file: denied");
}

TEST(ResponseFormatterTest, CompletedRunIsOkEvenWhenProgramFailed) {
    ExecutionOutcome outcome;
    outcome.termination = Termination::Exited;
    outcome.status = ExecutionStatus::Error;
    outcome.stderr_text = "boom";
    outcome.command = {"python", "./workspace/error_script.py"};
    outcome.return_code = 1;

    const auto reply = format_outcome(outcome);
    EXPECT_EQ(reply.status, 200);
    EXPECT_EQ(reply.body["status"], "error");
    EXPECT_EQ(reply.body["stdout"], "");
    EXPECT_EQ(reply.body["stderr"], "boom");
    EXPECT_EQ(reply.body["return_code"], 1);
    EXPECT_EQ(reply.body["command_executed"],
              (nlohmann::json{"python", "./workspace/error_script.py"}));
    EXPECT_EQ(reply.body.size(), 5u);
}

TEST(ResponseFormatterTest, TimeoutAndFaultStatuses) {
    ExecutionOutcome timed_out;
    timed_out.termination = Termination::TimedOut;
    timed_out.return_code = coderunner::protocol::kTimeoutReturnCode;
    EXPECT_EQ(format_outcome(timed_out).status, 408);
    EXPECT_EQ(format_outcome(timed_out).body["return_code"], -1);

    ExecutionOutcome faulted;
    faulted.termination = Termination::Faulted;
    faulted.return_code = coderunner::protocol::kFaultReturnCode;
    EXPECT_EQ(format_outcome(faulted).status, 500);
    EXPECT_EQ(format_outcome(faulted).body["return_code"], -2);
}

}  // namespace

#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/runner_errors.hpp"
#include "protocol/execution_contract.hpp"

namespace coderunner::collaborators {

struct RemoteRunResult {
    int http_status = 0;
    nlohmann::json body;
};

// Sends a validated request to a /run_code endpoint.
class RunnerClient {
public:
    virtual ~RunnerClient() = default;

    virtual core::errors::Result<RemoteRunResult> run(
        const std::string& address, const protocol::ExecutionRequest& request) = 0;
};

class HttpRunnerClient : public RunnerClient {
public:
    explicit HttpRunnerClient(int port = 5000, int connection_timeout_seconds = 10,
                              int read_timeout_seconds = 45);

    core::errors::Result<RemoteRunResult> run(
        const std::string& address, const protocol::ExecutionRequest& request) override;

private:
    int port_;
    int connection_timeout_seconds_;
    int read_timeout_seconds_;
};

}  // namespace coderunner::collaborators

#include "collaborators/runner_client.hpp"

#include <httplib.h>
#include "core/logging/logger.hpp"

namespace coderunner::collaborators {

using core::errors::ErrorCategory;
using core::errors::RunnerError;
using nlohmann::json;

HttpRunnerClient::HttpRunnerClient(const int port, const int connection_timeout_seconds,
                                   const int read_timeout_seconds)
    : port_(port),
      connection_timeout_seconds_(connection_timeout_seconds),
      read_timeout_seconds_(read_timeout_seconds) {}

core::errors::Result<RemoteRunResult> HttpRunnerClient::run(
    const std::string& address, const protocol::ExecutionRequest& request) {
    if (address.empty()) {
        return RunnerError{ErrorCategory::Input, "Runner address cannot be empty.",
                           "runner_unreachable"};
    }

    httplib::Client client(address, port_);
    client.set_connection_timeout(connection_timeout_seconds_, 0);
    client.set_read_timeout(read_timeout_seconds_, 0);

    const json payload = {{"code", request.code},
                          {"filename", request.filename},
                          {"language", request.language}};
    CODERUNNER_LOG_INFO("Forwarding " + request.filename + " to " + address + ":" +
                        std::to_string(port_));
    auto res = client.Post("/run_code", payload.dump(), "application/json");
    if (!res) {
        const std::string detail = httplib::to_string(res.error());
        CODERUNNER_LOG_ERROR("Runner request to " + address + " failed: " + detail);
        return RunnerError{ErrorCategory::Environment,
                           "Could not reach runner at " + address + ": " + detail,
                           "runner_unreachable"};
    }

    json body = json::parse(res->body, nullptr, false);
    if (body.is_discarded()) {
        return RunnerError{ErrorCategory::Environment,
                           "Runner returned a non-JSON response (HTTP " +
                               std::to_string(res->status) + ")",
                           "runner_bad_response"};
    }
    return RemoteRunResult{res->status, std::move(body)};
}

}  // namespace coderunner::collaborators

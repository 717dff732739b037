#pragma once

#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "core/config/server_config.hpp"
#include "core/errors/runner_errors.hpp"
#include "policy/request_validator.hpp"
#include "protocol/execution_contract.hpp"
#include "runtime/language_registry.hpp"
#include "runtime/process_runner.hpp"
#include "server/response_formatter.hpp"
#include "session/scratch_file_manager.hpp"

namespace coderunner::server {

// The /run_code pipeline without any transport: validate, write the scratch
// file, resolve the language, run, format, clean up.
class RunCodeHandler {
public:
    RunCodeHandler(std::filesystem::path workspace_root,
                   runtime::LanguageRegistry languages,
                   runtime::ProcessRunner runner);

    static core::errors::Result<std::shared_ptr<RunCodeHandler>> create(
        const core::config::ServerConfig& config);

    RunCodeHandler(const RunCodeHandler&) = delete;
    RunCodeHandler& operator=(const RunCodeHandler&) = delete;

    // Raw request body in, HTTP reply out. Never throws on bad input.
    HttpReply handle(const std::string& body);

    // Same pipeline for a request that already passed validation.
    HttpReply execute(const protocol::ExecutionRequest& request);

    nlohmann::json health() const;

    const policy::RequestValidator& validator() const { return validator_; }
    session::ScratchFileManager& scratch_files() { return scratch_files_; }

private:
    policy::RequestValidator validator_;
    session::ScratchFileManager scratch_files_;
    runtime::LanguageRegistry languages_;
    runtime::ProcessRunner runner_;
};

}  // namespace coderunner::server

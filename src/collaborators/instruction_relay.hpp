#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "collaborators/instruction_translator.hpp"
#include "collaborators/runner_client.hpp"
#include "collaborators/vm_provisioner.hpp"
#include "core/errors/runner_errors.hpp"
#include "policy/request_validator.hpp"
#include "protocol/execution_contract.hpp"

namespace coderunner::collaborators {

struct RelaySettings {
    std::string project_id;
    std::string instance_name = "code-runner-vm";
    std::string default_language = "python";
};

struct RelayReport {
    std::string instruction;
    std::string vm_address;
    protocol::ExecutionRequest request;
    int runner_status = 0;
    nlohmann::json runner_output;
};

nlohmann::json to_json(const RelayReport& report);

// Instruction -> running host -> translated request -> validated -> runner.
// The translator's output goes through the same validator as HTTP bodies.
class InstructionRelay {
public:
    InstructionRelay(VmProvisioner& provisioner, InstructionTranslator& translator,
                     RunnerClient& runner, RelaySettings settings);

    core::errors::Result<RelayReport> process(const std::string& instruction);

private:
    VmProvisioner& provisioner_;
    InstructionTranslator& translator_;
    RunnerClient& runner_;
    RelaySettings settings_;
    policy::RequestValidator validator_;
};

}  // namespace coderunner::collaborators

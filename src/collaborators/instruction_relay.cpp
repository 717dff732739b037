#include "collaborators/instruction_relay.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace coderunner::collaborators {

using core::errors::ErrorCategory;
using core::errors::RunnerError;

nlohmann::json to_json(const RelayReport& report) {
    return nlohmann::json{
        {"original_instruction", report.instruction},
        {"vm_ip", report.vm_address},
        {"request",
         {{"filename", report.request.filename},
          {"code", report.request.code},
          {"language", report.request.language}}},
        {"runner_status", report.runner_status},
        {"runner_output", report.runner_output}};
}

InstructionRelay::InstructionRelay(VmProvisioner& provisioner,
                                   InstructionTranslator& translator,
                                   RunnerClient& runner, RelaySettings settings)
    : provisioner_(provisioner),
      translator_(translator),
      runner_(runner),
      settings_(std::move(settings)),
      validator_(settings_.default_language) {}

core::errors::Result<RelayReport> InstructionRelay::process(
    const std::string& instruction) {
    if (instruction.empty()) {
        CODERUNNER_LOG_ERROR("No instruction provided.");
        return RunnerError{ErrorCategory::Input, "No instruction provided.",
                           "missing_instruction"};
    }
    CODERUNNER_LOG_INFO("Received instruction: " + instruction);

    auto address = provisioner_.ensure_ready(settings_.project_id,
                                             settings_.instance_name);
    if (core::errors::is_error(address)) {
        auto err = core::errors::get_error(address);
        CODERUNNER_LOG_ERROR("VM provisioning failed for '" + settings_.instance_name +
                             "': " + err.message);
        err.message = "VM provisioning failed: " + err.message;
        return err;
    }

    auto raw = translator_.translate(instruction);
    if (core::errors::is_error(raw)) {
        auto err = core::errors::get_error(raw);
        err.message = "Error processing instruction: " + err.message;
        return err;
    }

    auto request = parse_translation(core::errors::get_value(raw), validator_);
    if (core::errors::is_error(request)) {
        return core::errors::get_error(request);
    }

    RelayReport report;
    report.instruction = instruction;
    report.vm_address = core::errors::get_value(address);
    report.request = core::errors::get_value(request);

    auto remote = runner_.run(report.vm_address, report.request);
    if (core::errors::is_error(remote)) {
        return core::errors::get_error(remote);
    }
    report.runner_status = core::errors::get_value(remote).http_status;
    report.runner_output = core::errors::get_value(remote).body;
    CODERUNNER_LOG_INFO("Runner answered HTTP " + std::to_string(report.runner_status) +
                        " for " + report.request.filename);
    return report;
}

}  // namespace coderunner::collaborators

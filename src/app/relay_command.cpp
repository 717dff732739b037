#include "app/relay_command.hpp"

#include "collaborators/instruction_relay.hpp"
#include "collaborators/instruction_translator.hpp"
#include "collaborators/runner_client.hpp"
#include "collaborators/vm_provisioner.hpp"

namespace coderunner::app {

    using namespace coderunner::core::errors;

    Result<nlohmann::json> run_relay(const coderunner::core::config::RelayConfig& config) {
        collaborators::ProvisioningScript script;
        script.interpreter = config.interpreter;
        script.script = config.provision_script;
        script.status_script = config.status_script;
        script.timeout_seconds = config.provision_timeout_seconds;

        collaborators::ScriptVmProvisioner provisioner(script);
        collaborators::CommandInstructionTranslator translator(
            config.translator_command, config.translator_timeout_seconds);
        collaborators::HttpRunnerClient runner(config.runner_port);

        collaborators::RelaySettings settings;
        settings.project_id = config.project_id;
        settings.instance_name = config.instance_name;

        collaborators::InstructionRelay relay(provisioner, translator, runner, settings);
        auto report = relay.process(config.instruction);
        if (is_error(report)) {
            return get_error(report);
        }
        return collaborators::to_json(get_value(report));
    }

} // namespace coderunner::app

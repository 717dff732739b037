#pragma once
#include <nlohmann/json.hpp>
#include "core/config/relay_config.hpp"
#include "core/errors/runner_errors.hpp"

namespace coderunner::app {

    // Wires the script provisioner, command translator and HTTP runner client
    // into an InstructionRelay and runs one instruction through it.
    coderunner::core::errors::Result<nlohmann::json> run_relay(
        const coderunner::core::config::RelayConfig& config);

} // namespace coderunner::app

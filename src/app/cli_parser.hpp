#pragma once
#include "core/config/relay_config.hpp"
#include "core/config/server_config.hpp"
#include "core/errors/runner_errors.hpp"

namespace coderunner::app::cli {
    coderunner::core::errors::Result<coderunner::core::config::ServerConfig> parse_and_validate(int argc, char* argv[]);
    coderunner::core::errors::Result<coderunner::core::config::RelayConfig> parse_relay(int argc, char* argv[]);
}

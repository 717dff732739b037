#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace coderunner::core::config {

    // Validated settings for one `coderunner relay` invocation
    struct RelayConfig {
        std::string instruction;
        std::string project_id;
        std::string instance_name = "code-runner-vm";
        std::string interpreter = "python3";
        std::filesystem::path provision_script;
        std::filesystem::path status_script;
        std::uint32_t provision_timeout_seconds = 300;
        std::vector<std::string> translator_command;
        std::uint32_t translator_timeout_seconds = 60;
        int runner_port = 5000;
        bool verbose = false;
    };

} // namespace coderunner::core::config

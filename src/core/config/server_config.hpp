#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace coderunner::core::config {

    // Extra language registration from the command line: id -> argv template.
    struct LanguageOverride {
        std::string id;
        std::vector<std::string> argv_template;
    };

    // Validated settings for one server process
    struct ServerConfig {
        std::string host = "0.0.0.0";
        int port = 5000;
        std::filesystem::path workspace_root = "./workspace";
        std::uint32_t timeout_seconds = 30;
        std::string python_binary = "python";
        std::vector<LanguageOverride> extra_languages;
        std::uint32_t worker_threads = 8;
        bool verbose = false;
    };

} // namespace coderunner::core::config

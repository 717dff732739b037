#include "cli_parser.hpp"
#include <charconv>
#include <cstdint>
#include <optional>
#include <sstream>
#include <system_error>
#include <vector>

namespace coderunner::app::cli {

    using namespace coderunner::core::errors;
    using coderunner::core::config::LanguageOverride;
    using coderunner::core::config::RelayConfig;
    using coderunner::core::config::ServerConfig;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> host;
        std::optional<std::string> port;
        std::optional<std::string> workspace;
        std::optional<std::string> timeout_seconds;
        std::optional<std::string> python_bin;
        std::optional<std::string> threads;
        std::vector<std::string> languages;
        bool verbose = false;
    };

    struct RawRelayOptions {
        std::optional<std::string> instruction;
        std::optional<std::string> project_id;
        std::optional<std::string> instance;
        std::optional<std::string> interpreter;
        std::optional<std::string> provision_script;
        std::optional<std::string> status_script;
        std::optional<std::string> provision_timeout_seconds;
        std::optional<std::string> translator;
        std::optional<std::string> runner_port;
        bool verbose = false;
    };

    // Exception-free bounded integer parsing
    static std::optional<std::uint32_t> parse_bounded(const std::string& text, std::uint32_t min, std::uint32_t max) {
        std::uint32_t value = 0;
        const char* begin = text.data();
        const char* end = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(begin, end, value);
        if (ec != std::errc() || ptr != end || value < min || value > max) {
            return std::nullopt;
        }
        return value;
    }

    // "ruby=ruby {file}" -> {"ruby", ["ruby", "{file}"]}
    static Result<LanguageOverride> parse_language(const std::string& value) {
        const auto eq = value.find('=');
        if (eq == std::string::npos || eq == 0) {
            return RunnerError{ErrorCategory::Input, "Invalid --language value: " + value, "invalid_language_flag", "Expected ID=TEMPLATE, e.g. --language \"ruby=ruby {file}\"."};
        }

        LanguageOverride language;
        language.id = value.substr(0, eq);
        std::istringstream tokens(value.substr(eq + 1));
        std::string token;
        bool has_placeholder = false;
        while (tokens >> token) {
            has_placeholder = has_placeholder || token == "{file}";
            language.argv_template.push_back(token);
        }
        if (language.argv_template.empty() || !has_placeholder) {
            return RunnerError{ErrorCategory::Input, "Language template for '" + language.id + "' must contain {file}", "invalid_language_flag", "Expected ID=TEMPLATE, e.g. --language \"ruby=ruby {file}\"."};
        }
        return language;
    }

    Result<ServerConfig> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return RunnerError{ErrorCategory::Input, "No command provided.", "missing_command", "Usage: coderunner serve [--port 5000] [--workspace ./workspace]"};
        }

        std::string command = argv[1];
        if (command != "serve") {
            return RunnerError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Supported commands: serve, relay."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and 'serve' command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--host") {
                if (i + 1 < args.size()) raw.host = args[++i];
                else return RunnerError{ErrorCategory::Input, "Missing value for --host", "missing_value"};
            } else if (args[i] == "--port") {
                if (i + 1 < args.size()) raw.port = args[++i];
                else return RunnerError{ErrorCategory::Input, "Missing value for --port", "missing_value"};
            } else if (args[i] == "--workspace") {
                if (i + 1 < args.size()) raw.workspace = args[++i];
                else return RunnerError{ErrorCategory::Input, "Missing value for --workspace", "missing_value"};
            } else if (args[i] == "--timeout-seconds") {
                if (i + 1 < args.size()) raw.timeout_seconds = args[++i];
                else return RunnerError{ErrorCategory::Input, "Missing value for --timeout-seconds", "missing_value"};
            } else if (args[i] == "--python-bin") {
                if (i + 1 < args.size()) raw.python_bin = args[++i];
                else return RunnerError{ErrorCategory::Input, "Missing value for --python-bin", "missing_value"};
            } else if (args[i] == "--threads") {
                if (i + 1 < args.size()) raw.threads = args[++i];
                else return RunnerError{ErrorCategory::Input, "Missing value for --threads", "missing_value"};
            } else if (args[i] == "--language") {
                if (i + 1 < args.size()) raw.languages.push_back(args[++i]);
                else return RunnerError{ErrorCategory::Input, "Missing value for --language", "missing_value"};
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else {
                return RunnerError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        ServerConfig config;
        config.verbose = raw.verbose;

        if (raw.host) {
            if (raw.host->empty()) {
                return RunnerError{ErrorCategory::Input, "--host cannot be empty", "invalid_host"};
            }
            config.host = raw.host.value();
        }

        if (raw.port) {
            auto port = parse_bounded(raw.port.value(), 1, 65535);
            if (!port) {
                return RunnerError{ErrorCategory::Input, "Invalid value for --port", "invalid_integer", "Must be between 1 and 65535."};
            }
            config.port = static_cast<int>(port.value());
        }

        if (raw.timeout_seconds) {
            auto timeout = parse_bounded(raw.timeout_seconds.value(), 1, 3600);
            if (!timeout) {
                return RunnerError{ErrorCategory::Input, "Invalid value for --timeout-seconds", "invalid_integer", "Must be between 1 and 3600."};
            }
            config.timeout_seconds = timeout.value();
        }

        if (raw.threads) {
            auto threads = parse_bounded(raw.threads.value(), 1, 256);
            if (!threads) {
                return RunnerError{ErrorCategory::Input, "Invalid value for --threads", "invalid_integer", "Must be between 1 and 256."};
            }
            config.worker_threads = threads.value();
        }

        if (raw.python_bin) {
            if (raw.python_bin->empty()) {
                return RunnerError{ErrorCategory::Input, "--python-bin cannot be empty", "invalid_python_bin"};
            }
            config.python_binary = raw.python_bin.value();
        }

        for (const auto& value : raw.languages) {
            auto language = parse_language(value);
            if (is_error(language)) {
                return get_error(language);
            }
            config.extra_languages.push_back(get_value(language));
        }

        // Path validation: the workspace is created lazily, but an existing
        // non-directory can never work.
        if (raw.workspace) {
            if (raw.workspace->empty()) {
                return RunnerError{ErrorCategory::Input, "--workspace cannot be empty", "invalid_path"};
            }
            std::filesystem::path p(raw.workspace.value());
            std::error_code path_ec;
            const bool exists = std::filesystem::exists(p, path_ec);
            if (!path_ec && exists && !std::filesystem::is_directory(p, path_ec)) {
                return RunnerError{ErrorCategory::Input, "Workspace exists and is not a directory", "invalid_path"};
            }
            config.workspace_root = std::move(p);
        }

        return config;
    }

    Result<RelayConfig> parse_relay(int argc, char* argv[]) {
        if (argc < 2 || std::string(argv[1]) != "relay") {
            return RunnerError{ErrorCategory::Input, "Expected the 'relay' command.", "unknown_command"};
        }

        RawRelayOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) {
            args.push_back(argv[i]);
        }

        const auto take = [&args](size_t& i, std::optional<std::string>& slot) -> bool {
            if (i + 1 >= args.size()) {
                return false;
            }
            slot = args[++i];
            return true;
        };

        for (size_t i = 0; i < args.size(); ++i) {
            const std::string flag = args[i];
            bool ok = true;
            if (flag == "--instruction") ok = take(i, raw.instruction);
            else if (flag == "--project-id") ok = take(i, raw.project_id);
            else if (flag == "--instance") ok = take(i, raw.instance);
            else if (flag == "--interpreter") ok = take(i, raw.interpreter);
            else if (flag == "--provision-script") ok = take(i, raw.provision_script);
            else if (flag == "--status-script") ok = take(i, raw.status_script);
            else if (flag == "--provision-timeout-seconds") ok = take(i, raw.provision_timeout_seconds);
            else if (flag == "--translator") ok = take(i, raw.translator);
            else if (flag == "--runner-port") ok = take(i, raw.runner_port);
            else if (flag == "--verbose") raw.verbose = true;
            else return RunnerError{ErrorCategory::Input, "Unknown argument: " + flag, "unknown_argument"};

            if (!ok) {
                return RunnerError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
            }
        }

        RelayConfig config;
        config.verbose = raw.verbose;

        if (!raw.instruction) {
            return RunnerError{ErrorCategory::Input, "--instruction is required", "missing_value", "Usage: coderunner relay --instruction TEXT --project-id ID --provision-script PATH --translator \"CMD {instruction}\""};
        }
        config.instruction = raw.instruction.value();

        if (!raw.project_id || raw.project_id->empty()) {
            return RunnerError{ErrorCategory::Input, "--project-id is required", "missing_value"};
        }
        config.project_id = raw.project_id.value();

        if (raw.instance) {
            if (raw.instance->empty()) {
                return RunnerError{ErrorCategory::Input, "--instance cannot be empty", "invalid_instance"};
            }
            config.instance_name = raw.instance.value();
        }

        if (raw.interpreter) {
            if (raw.interpreter->empty()) {
                return RunnerError{ErrorCategory::Input, "--interpreter cannot be empty", "invalid_python_bin"};
            }
            config.interpreter = raw.interpreter.value();
        }

        if (!raw.provision_script || raw.provision_script->empty()) {
            return RunnerError{ErrorCategory::Input, "--provision-script is required", "missing_value"};
        }
        config.provision_script = raw.provision_script.value();
        if (raw.status_script) {
            config.status_script = raw.status_script.value();
        }
        for (const auto& script : {config.provision_script, config.status_script}) {
            std::error_code path_ec;
            if (!script.empty() && !std::filesystem::is_regular_file(script, path_ec)) {
                return RunnerError{ErrorCategory::Input, "Script not found: " + script.string(), "invalid_path"};
            }
        }

        if (raw.provision_timeout_seconds) {
            auto timeout = parse_bounded(raw.provision_timeout_seconds.value(), 1, 3600);
            if (!timeout) {
                return RunnerError{ErrorCategory::Input, "Invalid value for --provision-timeout-seconds", "invalid_integer", "Must be between 1 and 3600."};
            }
            config.provision_timeout_seconds = timeout.value();
        }

        if (raw.runner_port) {
            auto port = parse_bounded(raw.runner_port.value(), 1, 65535);
            if (!port) {
                return RunnerError{ErrorCategory::Input, "Invalid value for --runner-port", "invalid_integer", "Must be between 1 and 65535."};
            }
            config.runner_port = static_cast<int>(port.value());
        }

        if (!raw.translator) {
            return RunnerError{ErrorCategory::Input, "--translator is required", "missing_value"};
        }
        std::istringstream tokens(raw.translator.value());
        std::string token;
        bool has_placeholder = false;
        while (tokens >> token) {
            has_placeholder = has_placeholder || token == "{instruction}";
            config.translator_command.push_back(token);
        }
        if (!has_placeholder) {
            return RunnerError{ErrorCategory::Input, "--translator must contain {instruction}", "invalid_translator_flag", "Expected e.g. --translator \"/usr/local/bin/ask-model {instruction}\"."};
        }

        return config;
    }

} // namespace coderunner::app::cli

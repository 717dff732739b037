#include <csignal>
#include <pthread.h>
#include <signal.h>
#include <string>
#include <iostream>
#include "app/cli_parser.hpp"
#include "app/relay_command.hpp"
#include "core/errors/runner_errors.hpp"
#include "core/logging/logger.hpp"
#include "server/http_server.hpp"
#include "server/run_code_handler.hpp"

namespace {

// One instruction through provision -> translate -> /run_code. Prints the
// report (or {"error": ...}) as JSON on stdout.
int relay_main(int argc, char* argv[]) {
    auto parsed = coderunner::app::cli::parse_relay(argc, argv);
    if (coderunner::core::errors::is_error(parsed)) {
        const auto& err = coderunner::core::errors::get_error(parsed);
        CODERUNNER_LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            CODERUNNER_LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }

    const auto& config = coderunner::core::errors::get_value(parsed);
    if (config.verbose) {
        coderunner::core::logging::Logger::get().set_min_level(
            coderunner::core::logging::LogLevel::DEBUG);
    }

    auto report = coderunner::app::run_relay(config);
    if (coderunner::core::errors::is_error(report)) {
        const auto& err = coderunner::core::errors::get_error(report);
        CODERUNNER_LOG_ERROR("Relay failed [" + err.code + "]: " + err.message);
        std::cout << nlohmann::json{{"original_instruction", config.instruction},
                                    {"error", err.message}}
                         .dump(2)
                  << std::endl;
        return 1;
    }
    std::cout << coderunner::core::errors::get_value(report).dump(2) << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc >= 2 && std::string(argv[1]) == "relay") {
        return relay_main(argc, argv);
    }

    // 1. Parse CLI input and return normalized input errors
    CODERUNNER_LOG_INFO("coderunner: Bootstrapping...");
    auto parsed = coderunner::app::cli::parse_and_validate(argc, argv);
    if (coderunner::core::errors::is_error(parsed)) {
        const auto& err = coderunner::core::errors::get_error(parsed);
        CODERUNNER_LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            CODERUNNER_LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }

    const auto& config = coderunner::core::errors::get_value(parsed);
    if (config.verbose) {
        coderunner::core::logging::Logger::get().set_min_level(
            coderunner::core::logging::LogLevel::DEBUG);
    }

    // 2. Build the /run_code pipeline
    auto created = coderunner::server::RunCodeHandler::create(config);
    if (coderunner::core::errors::is_error(created)) {
        const auto& err = coderunner::core::errors::get_error(created);
        CODERUNNER_LOG_ERROR("Failed to prepare handler [" + err.code + "]: " +
                             err.message);
        return 2;
    }
    CODERUNNER_LOG_INFO("Workspace: " + config.workspace_root.string() +
                        ", timeout: " + std::to_string(config.timeout_seconds) +
                        "s, python: " + config.python_binary);

    // 3. Block shutdown signals before any worker thread exists so that only
    //    sigwait below sees them.
    std::signal(SIGPIPE, SIG_IGN);
    sigset_t shutdown_signals;
    sigemptyset(&shutdown_signals);
    sigaddset(&shutdown_signals, SIGINT);
    sigaddset(&shutdown_signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &shutdown_signals, nullptr);

    coderunner::server::HttpServer server(
        coderunner::core::errors::get_value(created), config.host, config.port,
        config.worker_threads);
    auto started = server.start();
    if (coderunner::core::errors::is_error(started)) {
        const auto& err = coderunner::core::errors::get_error(started);
        CODERUNNER_LOG_ERROR("Failed to start server [" + err.code + "]: " +
                             err.message);
        if (!err.hint.empty()) {
            CODERUNNER_LOG_INFO("Hint: " + err.hint);
        }
        return 3;
    }

    int received = 0;
    sigwait(&shutdown_signals, &received);
    CODERUNNER_LOG_INFO("Received signal " + std::to_string(received) +
                        ", shutting down");
    server.stop();
    return 0;
}

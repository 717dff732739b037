#include "server/run_code_handler.hpp"

#include <utility>
#include "core/config/request_id.hpp"
#include "core/logging/logger.hpp"

namespace coderunner::server {

using core::logging::ScopedRequestId;

RunCodeHandler::RunCodeHandler(std::filesystem::path workspace_root,
                               runtime::LanguageRegistry languages,
                               runtime::ProcessRunner runner)
    : validator_(languages.default_language()),
      scratch_files_(std::move(workspace_root)),
      languages_(std::move(languages)),
      runner_(runner) {}

core::errors::Result<std::shared_ptr<RunCodeHandler>> RunCodeHandler::create(
    const core::config::ServerConfig& config) {
    auto languages = runtime::LanguageRegistry::with_python(config.python_binary);
    for (const auto& extra : config.extra_languages) {
        auto registered = languages.register_language(extra.id, extra.argv_template);
        if (core::errors::is_error(registered)) {
            return core::errors::get_error(registered);
        }
    }

    auto handler = std::make_shared<RunCodeHandler>(
        config.workspace_root, std::move(languages),
        runtime::ProcessRunner(config.timeout_seconds));
    auto workspace = handler->scratch_files_.ensure_workspace();
    if (core::errors::is_error(workspace)) {
        return core::errors::get_error(workspace);
    }
    return handler;
}

HttpReply RunCodeHandler::handle(const std::string& body) {
    ScopedRequestId request_scope(core::config::generate_request_id());

    auto validated = validator_.validate_body(body);
    if (core::errors::is_error(validated)) {
        return format_rejection(core::errors::get_error(validated));
    }
    return execute(core::errors::get_value(validated));
}

HttpReply RunCodeHandler::execute(const protocol::ExecutionRequest& request) {
    auto materialized = scratch_files_.materialize(request.code, request.filename);
    if (core::errors::is_error(materialized)) {
        return format_rejection(core::errors::get_error(materialized));
    }
    session::ScratchFileGuard scratch_file(scratch_files_,
                                           core::errors::get_value(materialized));

    auto command = languages_.resolve(request.language, scratch_file.path());
    if (core::errors::is_error(command)) {
        CODERUNNER_LOG_ERROR("Unsupported language: " + request.language +
                             " for filename: " + request.filename);
        static_cast<void>(scratch_file.release());
        return format_rejection(core::errors::get_error(command));
    }

    const auto outcome = runner_.run(core::errors::get_value(command));
    CODERUNNER_LOG_INFO("Execution finished for " + request.filename + " (" +
                        protocol::to_string(outcome.termination) + ", return code " +
                        std::to_string(outcome.return_code) + ")");
    return format_outcome(outcome);
}

nlohmann::json RunCodeHandler::health() const {
    return nlohmann::json{{"status", "healthy"},
                          {"service", "coderunner"},
                          {"languages", languages_.languages()},
                          {"timeout_seconds", runner_.timeout_seconds()}};
}

}  // namespace coderunner::server

#include "policy/request_validator.hpp"

#include <filesystem>
#include <utility>
#include "core/logging/logger.hpp"

namespace coderunner::policy {

using core::errors::ErrorCategory;
using core::errors::RunnerError;
using nlohmann::json;

namespace {

// Returns the string value of a key, or an empty string when the key is
// absent, null, or not a string.
std::string string_field(const json& payload, const char* key) {
    const auto it = payload.find(key);
    if (it == payload.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

}  // namespace

RequestValidator::RequestValidator(std::string default_language)
    : default_language_(std::move(default_language)) {}

bool RequestValidator::is_safe_filename(const std::string& filename) {
    if (filename.find("..") != std::string::npos) {
        return false;
    }
    return std::filesystem::path(filename).filename().string() == filename;
}

core::errors::Result<protocol::ExecutionRequest> RequestValidator::validate_body(
    const std::string& body) const {
    const json payload = json::parse(body, nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        CODERUNNER_LOG_ERROR("Invalid JSON payload received.");
        return RunnerError{ErrorCategory::Input, kInvalidJsonMessage,
                           "malformed_input",
                           "Send a JSON object with 'code' and 'filename'."};
    }
    return validate_json(payload);
}

core::errors::Result<protocol::ExecutionRequest> RequestValidator::validate_json(
    const json& payload) const {
    if (!payload.is_object()) {
        CODERUNNER_LOG_ERROR("Invalid JSON payload received.");
        return RunnerError{ErrorCategory::Input, kInvalidJsonMessage,
                           "malformed_input"};
    }

    protocol::ExecutionRequest request;
    request.code = string_field(payload, "code");
    request.filename = string_field(payload, "filename");

    const auto language = payload.find("language");
    if (language == payload.end() || language->is_null()) {
        request.language = default_language_;
    } else if (language->is_string()) {
        request.language = language->get<std::string>();
    } else {
        request.language = language->dump();
    }

    CODERUNNER_LOG_INFO("Received request for filename: " + request.filename +
                        ", language: " + request.language);

    if (request.code.empty() || request.filename.empty()) {
        CODERUNNER_LOG_ERROR("Missing 'code' or 'filename' in request. Filename: " +
                             request.filename);
        return RunnerError{ErrorCategory::Input, kMissingFieldMessage,
                           "missing_field"};
    }

    if (!is_safe_filename(request.filename)) {
        CODERUNNER_LOG_ERROR(
            "Invalid filename (directory traversal attempt detected): " +
            request.filename);
        return RunnerError{ErrorCategory::Input, kPathTraversalMessage,
                           "path_traversal",
                           "Use a bare file name such as 'script.py'."};
    }

    return request;
}

}  // namespace coderunner::policy

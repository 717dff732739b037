#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/runner_errors.hpp"
#include "protocol/execution_contract.hpp"

namespace coderunner::policy {

// Error texts returned to HTTP callers; tests and clients match on them.
inline constexpr const char* kInvalidJsonMessage = "Invalid JSON payload";
inline constexpr const char* kMissingFieldMessage = "Missing 'code' or 'filename'";
inline constexpr const char* kPathTraversalMessage =
    "Invalid filename. Directory traversal attempt detected.";

class RequestValidator {
public:
    explicit RequestValidator(std::string default_language = "python");

    // Parses a raw HTTP body and validates it.
    core::errors::Result<protocol::ExecutionRequest> validate_body(
        const std::string& body) const;

    // Validates an already decoded JSON value (HTTP body or translator output).
    core::errors::Result<protocol::ExecutionRequest> validate_json(
        const nlohmann::json& payload) const;

    // True when the name is a bare file name with no traversal segments.
    static bool is_safe_filename(const std::string& filename);

    const std::string& default_language() const { return default_language_; }

private:
    std::string default_language_;
};

}  // namespace coderunner::policy

#pragma once
#include <string>
#include <variant>

namespace coderunner::core::errors {

    // 1. Define typed error categories
    enum class ErrorCategory {
        Input,        // E.g., malformed JSON body or a traversal filename
        Execution,    // E.g., the child timed out or could not be started
        Environment,  // E.g., the workspace cannot be written
        Policy,       // E.g., a language that is not registered
        Internal      // E.g., pipe or fork failure
    };

    // The standardized error payload
    struct RunnerError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
    };

    // 2. Define the Propagation Strategy (Result Object)
    // A Result will hold either a successful value of type T, OR a RunnerError.
    template <typename T>
    using Result = std::variant<T, RunnerError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<RunnerError>(result);
    }

    template <typename T>
    const RunnerError& get_error(const Result<T>& result) {
        return std::get<RunnerError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:       return "input";
            case ErrorCategory::Execution:   return "execution";
            case ErrorCategory::Environment: return "environment";
            case ErrorCategory::Policy:      return "policy";
            case ErrorCategory::Internal:    return "internal";
            default: return "unknown";
        }
    }

} // namespace coderunner::core::errors

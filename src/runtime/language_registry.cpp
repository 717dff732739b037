#include "runtime/language_registry.hpp"

#include <algorithm>
#include <utility>
#include "core/logging/logger.hpp"

namespace coderunner::runtime {

using core::errors::ErrorCategory;
using core::errors::RunnerError;

LanguageRegistry::LanguageRegistry(std::string default_language)
    : default_language_(std::move(default_language)) {}

LanguageRegistry LanguageRegistry::with_python(const std::string& interpreter) {
    LanguageRegistry registry("python");
    static_cast<void>(registry.register_language("python", {interpreter, kFilePlaceholder}));
    return registry;
}

core::errors::Result<bool> LanguageRegistry::register_language(
    const std::string& id, std::vector<std::string> argv_template) {
    if (id.empty()) {
        return RunnerError{ErrorCategory::Input, "Language id cannot be empty.",
                           "invalid_language_id"};
    }
    if (argv_template.empty() || argv_template.front().empty()) {
        return RunnerError{ErrorCategory::Input,
                           "Command template for '" + id + "' has no program.",
                           "invalid_language_template"};
    }
    const bool has_placeholder =
        std::find(argv_template.begin(), argv_template.end(), kFilePlaceholder) !=
        argv_template.end();
    if (!has_placeholder) {
        return RunnerError{ErrorCategory::Input,
                           "Command template for '" + id + "' must contain {file}.",
                           "invalid_language_template",
                           "Use a template such as \"python3 {file}\"."};
    }

    const bool replaced = templates_.count(id) != 0;
    templates_[id] = std::move(argv_template);
    CODERUNNER_LOG_DEBUG("Registered language " + id);
    return replaced;
}

core::errors::Result<std::vector<std::string>> LanguageRegistry::resolve(
    const std::string& id, const std::filesystem::path& file_path) const {
    const auto it = templates_.find(id);
    if (it == templates_.end()) {
        return RunnerError{ErrorCategory::Policy, "Unsupported language: " + id,
                           "unsupported_language"};
    }

    std::vector<std::string> command;
    command.reserve(it->second.size());
    for (const auto& part : it->second) {
        command.push_back(part == kFilePlaceholder ? file_path.string() : part);
    }
    return command;
}

bool LanguageRegistry::supports(const std::string& id) const {
    return templates_.count(id) != 0;
}

std::vector<std::string> LanguageRegistry::languages() const {
    std::vector<std::string> ids;
    ids.reserve(templates_.size());
    for (const auto& entry : templates_) {
        ids.push_back(entry.first);
    }
    return ids;
}

}  // namespace coderunner::runtime

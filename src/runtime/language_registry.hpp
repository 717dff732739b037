#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "core/errors/runner_errors.hpp"

namespace coderunner::runtime {

// Placeholder replaced by the scratch file path in argv templates.
inline constexpr const char* kFilePlaceholder = "{file}";

// Maps language identifiers to argv templates. New languages are added by
// registration.
class LanguageRegistry {
public:
    explicit LanguageRegistry(std::string default_language = "python");

    // Registry with the default language bound to the given interpreter.
    static LanguageRegistry with_python(const std::string& interpreter);

    core::errors::Result<bool> register_language(
        const std::string& id, std::vector<std::string> argv_template);

    // Builds the argv for running file_path as the given language.
    core::errors::Result<std::vector<std::string>> resolve(
        const std::string& id, const std::filesystem::path& file_path) const;

    bool supports(const std::string& id) const;
    std::vector<std::string> languages() const;
    const std::string& default_language() const { return default_language_; }

private:
    std::string default_language_;
    std::map<std::string, std::vector<std::string>> templates_;
};

}  // namespace coderunner::runtime

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "core/errors/runner_errors.hpp"
#include "policy/request_validator.hpp"
#include "protocol/execution_contract.hpp"

namespace coderunner::collaborators {

// Turns a natural-language instruction into model text that should hold a
// JSON object with "filename", "code" and "language".
class InstructionTranslator {
public:
    virtual ~InstructionTranslator() = default;

    virtual core::errors::Result<std::string> translate(
        const std::string& instruction) = 0;
};

// Runs an external command and takes its stdout as the model text. Every
// "{instruction}" token in the template is replaced by the full prompt
// (kTranslationPrompt followed by the instruction).
class CommandInstructionTranslator : public InstructionTranslator {
public:
    CommandInstructionTranslator(std::vector<std::string> argv_template,
                                 std::uint32_t timeout_seconds = 60);

    core::errors::Result<std::string> translate(const std::string& instruction) override;

private:
    std::vector<std::string> argv_template_;
    std::uint32_t timeout_seconds_;
};

inline constexpr const char* kInstructionPlaceholder = "{instruction}";

// Prompt prefix for translators backed by a generative model.
extern const char* const kTranslationPrompt;

// Strips Markdown fences, parses the JSON object, requires all three keys and
// runs the request validator over it.
core::errors::Result<protocol::ExecutionRequest> parse_translation(
    const std::string& raw_text, const policy::RequestValidator& validator);

}  // namespace coderunner::collaborators

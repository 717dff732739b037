#include "collaborators/instruction_translator.hpp"

#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "runtime/process_runner.hpp"

namespace coderunner::collaborators {

using core::errors::ErrorCategory;
using core::errors::RunnerError;
using nlohmann::json;

const char* const kTranslationPrompt =
    "You are an expert coding assistant. Translate the user's natural language "
    "instruction into a JSON object that specifies code to be run on a Linux VM. "
    "The JSON object must have the keys 'filename' (a bare file name such as "
    "'script.py'), 'code' (the full source, newlines escaped as \\n) and "
    "'language' (for example 'python'; default to 'python' if unsure). "
    "Output ONLY the JSON object, with no other text before or after it.";

namespace {

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

bool starts_with(const std::string& value, const std::string& prefix) {
    return value.rfind(prefix, 0) == 0;
}

bool ends_with(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string strip_fences(std::string text) {
    text = trim(text);
    if (starts_with(text, "```json")) {
        text = text.substr(7);
    } else if (starts_with(text, "```")) {
        text = text.substr(3);
    }
    if (ends_with(text, "```")) {
        text = text.substr(0, text.size() - 3);
    }
    return trim(text);
}

}  // namespace

CommandInstructionTranslator::CommandInstructionTranslator(
    std::vector<std::string> argv_template, const std::uint32_t timeout_seconds)
    : argv_template_(std::move(argv_template)), timeout_seconds_(timeout_seconds) {}

core::errors::Result<std::string> CommandInstructionTranslator::translate(
    const std::string& instruction) {
    const std::string prompt =
        std::string(kTranslationPrompt) + "\n\nUser Instruction: " + instruction;

    std::vector<std::string> command;
    command.reserve(argv_template_.size());
    for (const auto& part : argv_template_) {
        command.push_back(part == kInstructionPlaceholder ? prompt : part);
    }
    CODERUNNER_LOG_INFO("Sending prompt to translator for instruction: '" +
                        instruction + "'");

    const runtime::ProcessRunner runner(timeout_seconds_);
    auto captured = runner.capture(command);
    if (core::errors::is_error(captured)) {
        return RunnerError{ErrorCategory::Execution,
                           core::errors::get_error(captured).message,
                           "translation_failed"};
    }

    const auto& result = core::errors::get_value(captured);
    if (result.timed_out) {
        return RunnerError{ErrorCategory::Execution,
                           "Translator timed out after " +
                               std::to_string(timeout_seconds_) + " seconds.",
                           "translation_failed"};
    }
    if (result.exit_code != 0) {
        const std::string detail =
            !result.stderr_text.empty() ? trim(result.stderr_text)
                                        : "exit code " + std::to_string(result.exit_code);
        CODERUNNER_LOG_ERROR("Translator command failed: " + detail);
        return RunnerError{ErrorCategory::Execution, detail, "translation_failed"};
    }

    CODERUNNER_LOG_DEBUG("Raw translator response: " + result.stdout_text);
    return result.stdout_text;
}

core::errors::Result<protocol::ExecutionRequest> parse_translation(
    const std::string& raw_text, const policy::RequestValidator& validator) {
    const std::string text = strip_fences(raw_text);
    const json payload = json::parse(text, nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        CODERUNNER_LOG_ERROR("Failed to parse translator response as JSON: " + text);
        return RunnerError{ErrorCategory::Execution,
                           "Translator output was not valid JSON: " + text,
                           "translation_not_json"};
    }

    for (const char* key : {"filename", "code", "language"}) {
        if (!payload.contains(key)) {
            CODERUNNER_LOG_ERROR("Translator output missing required fields: " + text);
            return RunnerError{ErrorCategory::Execution,
                               "Translator output did not contain all required fields "
                               "(filename, code, language).",
                               "translation_incomplete"};
        }
    }

    return validator.validate_json(payload);
}

}  // namespace coderunner::collaborators

#include "collaborators/vm_provisioner.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"
#include "protocol/execution_contract.hpp"
#include "runtime/process_runner.hpp"

namespace coderunner::collaborators {

using core::errors::ErrorCategory;
using core::errors::RunnerError;

namespace {

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

bool is_dotted_quad(const std::string& line) {
    std::istringstream in(line);
    std::string part;
    int parts = 0;
    while (std::getline(in, part, '.')) {
        if (part.empty() ||
            !std::all_of(part.begin(), part.end(),
                         [](const unsigned char c) { return std::isdigit(c) != 0; })) {
            return false;
        }
        ++parts;
    }
    return parts == 4 && line.back() != '.';
}

}  // namespace

std::optional<std::string> extract_address(const std::string& output) {
    static const std::string kMarker = "external ip:";

    std::vector<std::string> lines;
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(trim(line));
    }

    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        if (it->empty()) {
            continue;
        }
        const auto marker = lowercase(*it).find(kMarker);
        if (marker != std::string::npos) {
            const std::string address = trim(it->substr(marker + kMarker.size()));
            if (!address.empty()) {
                return address;
            }
            continue;
        }
        if (is_dotted_quad(*it)) {
            return *it;
        }
    }
    return std::nullopt;
}

std::optional<InstanceStatus> parse_instance_status(const std::string& output) {
    std::istringstream in(output);
    std::string line;
    std::string last;
    while (std::getline(in, line)) {
        line = trim(line);
        if (!line.empty()) {
            last = line;
        }
    }
    if (last.empty()) {
        return std::nullopt;
    }

    std::istringstream tokens(last);
    InstanceStatus status;
    tokens >> status.state;
    std::transform(status.state.begin(), status.state.end(), status.state.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::toupper(c));
                   });
    std::string address;
    if (tokens >> address) {
        status.address = address;
    }
    return status;
}

ScriptVmProvisioner::ScriptVmProvisioner(ProvisioningScript settings)
    : settings_(std::move(settings)) {}

core::errors::Result<InstanceStatus> ScriptVmProvisioner::query_status(
    const std::string& project_id, const std::string& instance_name) {
    std::error_code ec;
    if (settings_.status_script.empty() ||
        !std::filesystem::exists(settings_.status_script, ec) || ec) {
        return RunnerError{ErrorCategory::Environment,
                           "Status script not found at the configured path.",
                           "provisioning_not_configured"};
    }

    const std::vector<std::string> command = {
        settings_.interpreter, settings_.status_script.string(), "--project_id",
        project_id, "--vm_name", instance_name};
    CODERUNNER_LOG_DEBUG("Checking VM status: " + protocol::join_command(command));

    const runtime::ProcessRunner runner(settings_.timeout_seconds);
    auto captured = runner.capture(command);
    if (core::errors::is_error(captured)) {
        return RunnerError{ErrorCategory::Execution,
                           "Error checking VM status: " +
                               core::errors::get_error(captured).message,
                           "provisioning_status_failed"};
    }

    const auto& result = core::errors::get_value(captured);
    if (result.timed_out || result.exit_code != 0) {
        const std::string detail = result.timed_out            ? "status script timed out"
                                   : !result.stderr_text.empty() ? result.stderr_text
                                                                 : result.stdout_text;
        CODERUNNER_LOG_ERROR("Error getting VM status for '" + instance_name + "': " +
                             detail);
        return RunnerError{ErrorCategory::Execution,
                           "Error checking VM status: " + detail,
                           "provisioning_status_failed"};
    }

    auto status = parse_instance_status(result.stdout_text);
    if (!status || status->state == "ERROR") {
        const std::string detail = trim(result.stdout_text);
        return RunnerError{ErrorCategory::Execution,
                           "Error checking VM status: " +
                               (detail.empty() ? std::string("no status reported") : detail),
                           "provisioning_status_failed"};
    }

    CODERUNNER_LOG_INFO("VM '" + instance_name + "' status: " + status->state +
                        ", IP: " + status->address.value_or("none"));
    return status.value();
}

core::errors::Result<std::string> ScriptVmProvisioner::ensure_ready(
    const std::string& project_id, const std::string& instance_name) {
    if (settings_.script.empty() || project_id.empty() || instance_name.empty()) {
        CODERUNNER_LOG_ERROR("Provisioning script, project or instance name not configured.");
        return RunnerError{ErrorCategory::Input,
                           "Provisioning script, project id and instance name are required.",
                           "provisioning_not_configured"};
    }

    if (!settings_.status_script.empty()) {
        auto status = query_status(project_id, instance_name);
        if (core::errors::is_error(status)) {
            return core::errors::get_error(status);
        }
        const auto& current = core::errors::get_value(status);
        if (current.state == "RUNNING") {
            if (!current.address) {
                return RunnerError{ErrorCategory::Execution,
                                   "Could not obtain VM IP address.",
                                   "provisioning_no_address"};
            }
            return current.address.value();
        }
        CODERUNNER_LOG_INFO("VM '" + instance_name + "' is not running (status: " +
                            current.state + "). Attempting to create/start.");
    }

    return provision(project_id, instance_name);
}

core::errors::Result<std::string> ScriptVmProvisioner::provision(
    const std::string& project_id, const std::string& instance_name) {
    std::error_code ec;
    if (!std::filesystem::exists(settings_.script, ec) || ec) {
        CODERUNNER_LOG_ERROR("Provisioning script not found at: " +
                             settings_.script.string());
        return RunnerError{ErrorCategory::Environment,
                           "Provisioning script not found at the configured path.",
                           "provisioning_not_configured"};
    }

    const std::vector<std::string> command = {
        settings_.interpreter, settings_.script.string(), "--project_id", project_id,
        "--vm_name", instance_name};
    CODERUNNER_LOG_INFO("Executing VM provisioning script: " +
                        protocol::join_command(command));

    const runtime::ProcessRunner runner(settings_.timeout_seconds);
    auto captured = runner.capture(command);
    if (core::errors::is_error(captured)) {
        const auto& err = core::errors::get_error(captured);
        return RunnerError{ErrorCategory::Execution,
                           "Error during VM provisioning: " + err.message,
                           "provisioning_failed"};
    }

    const auto& result = core::errors::get_value(captured);
    if (result.timed_out) {
        CODERUNNER_LOG_ERROR("Timeout executing provisioning script.");
        return RunnerError{ErrorCategory::Execution,
                           "VM provisioning script timed out.",
                           "provisioning_timeout"};
    }
    if (result.exit_code != 0) {
        CODERUNNER_LOG_ERROR("Provisioning script failed with return code " +
                             std::to_string(result.exit_code));
        const std::string detail = !result.stderr_text.empty()   ? result.stderr_text
                                   : !result.stdout_text.empty() ? result.stdout_text
                                                                 : "Unknown error";
        return RunnerError{ErrorCategory::Execution,
                           "Error during VM provisioning: " + detail,
                           "provisioning_failed"};
    }

    auto address = extract_address(result.stdout_text);
    if (!address) {
        CODERUNNER_LOG_ERROR("Provisioning script output did not contain an address:\n" +
                             result.stdout_text);
        return RunnerError{ErrorCategory::Execution,
                           "Provisioning script ran, but IP address could not be "
                           "determined from output.",
                           "provisioning_no_address"};
    }

    CODERUNNER_LOG_INFO("Provisioned " + instance_name + " at " + address.value());
    return address.value();
}

}  // namespace coderunner::collaborators

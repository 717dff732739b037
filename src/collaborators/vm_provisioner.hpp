#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/runner_errors.hpp"

namespace coderunner::collaborators {

// Brings up (or finds) the host that serves /run_code and returns its
// externally reachable address. May block for minutes.
class VmProvisioner {
public:
    virtual ~VmProvisioner() = default;

    virtual core::errors::Result<std::string> ensure_ready(
        const std::string& project_id, const std::string& instance_name) = 0;
};

struct ProvisioningScript {
    std::string interpreter = "python3";
    std::filesystem::path script;
    // Optional. Prints "<STATE> [<ADDRESS>]", e.g. "RUNNING 34.1.2.3" or
    // "NOT_FOUND", on its last non-empty line.
    std::filesystem::path status_script;
    std::uint32_t timeout_seconds = 300;
};

struct InstanceStatus {
    std::string state;
    std::optional<std::string> address;
};

// Runs external scripts, each as
//   <interpreter> <script> --project_id <project> --vm_name <instance>
// A RUNNING instance reported by the status script is reused; anything else
// goes through the provisioning script, whose output carries the address.
class ScriptVmProvisioner : public VmProvisioner {
public:
    explicit ScriptVmProvisioner(ProvisioningScript settings);

    core::errors::Result<std::string> ensure_ready(
        const std::string& project_id, const std::string& instance_name) override;

    core::errors::Result<InstanceStatus> query_status(const std::string& project_id,
                                                      const std::string& instance_name);

private:
    core::errors::Result<std::string> provision(const std::string& project_id,
                                                const std::string& instance_name);

    ProvisioningScript settings_;
};

// Reads the last non-empty line as "<STATE> [<ADDRESS>]". State is upper-cased.
std::optional<InstanceStatus> parse_instance_status(const std::string& output);

// Scans output bottom-up for "External IP: <addr>" (any case) or a line that
// is a bare dotted quad.
std::optional<std::string> extract_address(const std::string& output);

}  // namespace coderunner::collaborators

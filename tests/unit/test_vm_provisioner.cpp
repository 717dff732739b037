#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <gtest/gtest.h>
#include "collaborators/vm_provisioner.hpp"
#include "core/config/request_id.hpp"
#include "core/errors/runner_errors.hpp"

namespace {

using coderunner::collaborators::extract_address;
using coderunner::collaborators::parse_instance_status;
using coderunner::collaborators::ProvisioningScript;
using coderunner::collaborators::ScriptVmProvisioner;
using coderunner::core::errors::get_error;
using coderunner::core::errors::get_value;
using coderunner::core::errors::is_error;

class TempScript {
public:
    explicit TempScript(const std::string& body) {
        path_ = std::filesystem::current_path() /
                (".tmp_provision_" + coderunner::core::config::generate_id("sh") + ".sh");
        std::ofstream out(path_);
        out << body;
    }

    ~TempScript() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

ProvisioningScript shell_script(const TempScript& script, std::uint32_t timeout = 5) {
    ProvisioningScript settings;
    settings.interpreter = "/bin/sh";
    settings.script = script.path();
    settings.timeout_seconds = timeout;
    return settings;
}

TEST(ExtractAddressTest, FindsMarkerLine) {
    EXPECT_EQ(extract_address("Creating...\nVM created. External IP: 34.1.2.3\n\n"),
              "34.1.2.3");
    EXPECT_EQ(extract_address("VM 'code-runner-vm' external IP: 10.0.0.7\nReminder: firewall\n"),
              "10.0.0.7");
}

TEST(ExtractAddressTest, FindsBareDottedQuad) {
    EXPECT_EQ(extract_address("booting\n192.168.1.20\n"), "192.168.1.20");
}

TEST(ExtractAddressTest, NoAddress) {
    EXPECT_FALSE(extract_address("").has_value());
    EXPECT_FALSE(extract_address("done\nversion 1.2.3\n").has_value());
    EXPECT_FALSE(extract_address("1.2.3.\n").has_value());
}

TEST(ScriptVmProvisionerTest, ReturnsAddressFromScript) {
    TempScript script(
        "echo \"project=$2 vm=$4\"\n"
        "echo \"VM created successfully. External IP: 35.9.8.7\"\n"
        "echo\n");
    ScriptVmProvisioner provisioner(shell_script(script));

    auto result = provisioner.ensure_ready("demo-project", "code-runner-vm");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "35.9.8.7");
}

TEST(ScriptVmProvisionerTest, PassesProjectAndInstance) {
    TempScript script("echo \"$1 $2 $3 $4\" >&2\n[ \"$2\" = p1 ] && [ \"$4\" = vm1 ] && echo 1.1.1.1\n");
    ScriptVmProvisioner provisioner(shell_script(script));

    auto result = provisioner.ensure_ready("p1", "vm1");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "1.1.1.1");
}

TEST(ScriptVmProvisionerTest, NonZeroExitCarriesStderr) {
    TempScript script("echo 'quota exceeded' >&2\nexit 1\n");
    ScriptVmProvisioner provisioner(shell_script(script));

    auto result = provisioner.ensure_ready("p", "vm");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "provisioning_failed");
    EXPECT_NE(get_error(result).message.find("quota exceeded"), std::string::npos);
}

TEST(ScriptVmProvisionerTest, MissingAddress) {
    TempScript script("echo 'all done'\n");
    ScriptVmProvisioner provisioner(shell_script(script));

    auto result = provisioner.ensure_ready("p", "vm");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "provisioning_no_address");
}

TEST(ScriptVmProvisionerTest, Timeout) {
    TempScript script("sleep 30\n");
    ScriptVmProvisioner provisioner(shell_script(script, 1));

    auto result = provisioner.ensure_ready("p", "vm");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "provisioning_timeout");
}

TEST(ScriptVmProvisionerTest, NotConfigured) {
    ScriptVmProvisioner unconfigured(ProvisioningScript{});
    auto result = unconfigured.ensure_ready("p", "vm");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "provisioning_not_configured");

    ProvisioningScript missing;
    missing.script = std::filesystem::current_path() / "__no_such_provision_script__.py";
    ScriptVmProvisioner provisioner(missing);
    auto not_found = provisioner.ensure_ready("p", "vm");
    ASSERT_TRUE(is_error(not_found));
    EXPECT_EQ(get_error(not_found).code, "provisioning_not_configured");
}

TEST(ParseInstanceStatusTest, ReadsStateAndAddress) {
    auto running = parse_instance_status("checking...\nrunning 34.9.9.9\n\n");
    ASSERT_TRUE(running.has_value());
    EXPECT_EQ(running->state, "RUNNING");
    EXPECT_EQ(running->address, "34.9.9.9");

    auto missing = parse_instance_status("NOT_FOUND\n");
    ASSERT_TRUE(missing.has_value());
    EXPECT_EQ(missing->state, "NOT_FOUND");
    EXPECT_FALSE(missing->address.has_value());

    EXPECT_FALSE(parse_instance_status("\n  \n").has_value());
}

class StatusAwareProvisionerTest : public ::testing::Test {
protected:
    // The create script leaves a marker so tests can tell whether it ran.
    void SetUp() override {
        marker_ = std::filesystem::current_path() /
                  (".tmp_created_" + coderunner::core::config::generate_id("vm"));
        create_ = std::make_unique<TempScript>(
            "touch '" + marker_.string() + "'\necho 'External IP: 9.9.9.9'\n");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(marker_, ec);
    }

    ProvisioningScript settings(const TempScript& status) const {
        ProvisioningScript script = shell_script(*create_);
        script.status_script = status.path();
        return script;
    }

    bool create_ran() const { return std::filesystem::exists(marker_); }

    std::filesystem::path marker_;
    std::unique_ptr<TempScript> create_;
};

TEST_F(StatusAwareProvisionerTest, ReusesRunningInstance) {
    TempScript status("echo 'RUNNING 10.1.1.1'\n");
    ScriptVmProvisioner provisioner(settings(status));

    for (int i = 0; i < 2; ++i) {
        auto result = provisioner.ensure_ready("p", "code-runner-vm");
        ASSERT_FALSE(is_error(result));
        EXPECT_EQ(get_value(result), "10.1.1.1");
    }
    EXPECT_FALSE(create_ran());
}

TEST_F(StatusAwareProvisionerTest, ProvisionsWhenNotRunning) {
    for (const char* state : {"NOT_FOUND", "TERMINATED", "STOPPED"}) {
        TempScript status(std::string("echo ") + state + "\n");
        ScriptVmProvisioner provisioner(settings(status));

        auto result = provisioner.ensure_ready("p", "code-runner-vm");
        ASSERT_FALSE(is_error(result)) << state;
        EXPECT_EQ(get_value(result), "9.9.9.9");
        EXPECT_TRUE(create_ran()) << state;
        std::filesystem::remove(marker_);
    }
}

TEST_F(StatusAwareProvisionerTest, StatusErrorStopsBeforeProvisioning) {
    TempScript failing("echo 'credentials missing' >&2\nexit 1\n");
    ScriptVmProvisioner provisioner(settings(failing));
    auto result = provisioner.ensure_ready("p", "vm");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "provisioning_status_failed");
    EXPECT_NE(get_error(result).message.find("credentials missing"), std::string::npos);

    TempScript reported("echo 'ERROR permission denied'\n");
    ScriptVmProvisioner reporting(settings(reported));
    auto reported_result = reporting.ensure_ready("p", "vm");
    ASSERT_TRUE(is_error(reported_result));
    EXPECT_EQ(get_error(reported_result).code, "provisioning_status_failed");
    EXPECT_NE(get_error(reported_result).message.find("permission denied"),
              std::string::npos);

    EXPECT_FALSE(create_ran());
}

TEST_F(StatusAwareProvisionerTest, RunningWithoutAddressFails) {
    TempScript status("echo RUNNING\n");
    ScriptVmProvisioner provisioner(settings(status));

    auto result = provisioner.ensure_ready("p", "vm");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "provisioning_no_address");
    EXPECT_FALSE(create_ran());
}

}  // namespace

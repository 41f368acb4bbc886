#include "catch2_custom.hpp"

#include "config/campaign_config.hpp"
#include "config/config_loader.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

using namespace vmchecker;
using namespace std::chrono_literals;
using std::filesystem::path;

namespace {

const path config_dir = path{RESOURCES_DIR} / "config";

/// Smallest valid configuration, with ``extra`` appended
std::string minimal_yaml(const std::string& test_section, const std::string& extra = "") {
    return R"(host:
  vmx_path: so.vmx
  vmchecker_root: /root
  jobs_path: jobs
  scripts_path: scripts
guest:
  username: so
  password: so
  shell: /bin/bash
  root_path:
    native_style: /home/so/
    shell_style: /home/so/
    separator: /
)" + test_section +
           extra;
}

const std::string ONE_STAGE = "test:\n  - script: [run.sh]\n    timeout: 5\n";

} // namespace

TEST_CASE("Read a full Linux guest configuration") {
    ConfigLoader loader{config_dir / "campaign.yaml"};
    auto res = loader.read();

    REQUIRE(res);
    const CampaignConfig& config = res.value();

    REQUIRE(config.host.vmx_path == "/var/lib/vmchecker/vm/so-linux/so-linux.vmx");
    REQUIRE(config.host.jobs_path == path{"/var/lib/vmchecker/executor_jobs"});
    REQUIRE(config.host.scripts_path == path{"/opt/vmchecker/scripts"});
    REQUIRE(config.host.vmrun_path == "/usr/bin/vmrun");
    REQUIRE(config.host.host_type == "ws");

    REQUIRE(config.guest.credentials.username == "so");
    REQUIRE(config.guest.shell == "/bin/bash");
    REQUIRE(config.guest.root.native_path("run.sh") == "/home/so/run.sh");

    const auto& stages = config.campaign.stages();
    REQUIRE(stages.size() == 2);
    REQUIRE(stages[0].input_files == std::vector<std::string>{"file.zip", "tests.zip"});
    REQUIRE(stages[0].script_files == std::vector<std::string>{"build.sh"});
    REQUIRE(stages[0].output_files == std::vector<std::string>{"build-stdout.vmr", "build-stderr.vmr"});
    REQUIRE(stages[0].timeout == 120s);
    REQUIRE(stages[1].input_files.empty());
    REQUIRE(stages[1].timeout == 30s);

    REQUIRE(config.campaign.kernel_monitor());
    REQUIRE(config.kernel_monitor.port == 6667);
    REQUIRE(config.kernel_monitor.log_path == path{"/var/lib/vmchecker/executor_jobs/kernel_messages.log"});
}

TEST_CASE("Read a Windows guest configuration with a remote host") {
    auto res = ConfigLoader{config_dir / "windows_guest.yaml"}.read();

    REQUIRE(res);
    const CampaignConfig& config = res.value();

    REQUIRE(config.host.vmx_path == "[datastore1] win7/win7.vmx");
    REQUIRE(config.host.host_type == "esx");
    REQUIRE(config.host.vmrun_path == "vmrun");
    REQUIRE(config.guest.credentials.password == "p@ss: word");
    REQUIRE(config.guest.root.native_path("run.sh") == R"(C:\cygwin\home\so\run.sh)");
    REQUIRE(config.guest.root.shell_path("run.sh") == "/home/so/run.sh");

    REQUIRE_FALSE(config.campaign.kernel_monitor());
    REQUIRE(config.kernel_monitor.port == KernelMonitorConfig::DEFAULT_PORT);
    REQUIRE(config.kernel_monitor.log_path == path{"/var/log/vmchecker/kernel.log"});
}

TEST_CASE("Errors name the offending entry") {
    SECTION("Missing stage timeout") {
        auto res = ConfigLoader{config_dir / "missing_timeout.yaml"}.read();
        REQUIRE_FALSE(res);
        REQUIRE_THAT(res.error(), Catch::Matchers::ContainsSubstring("test[1].timeout"));
    }

    SECTION("Non-positive timeout") {
        auto res = ConfigLoader::parse(minimal_yaml("test:\n  - script: [run.sh]\n    timeout: 0\n"));
        REQUIRE_THAT(res.error(), Catch::Matchers::ContainsSubstring("test[0].timeout"));
    }

    SECTION("Timeout longer than a day") {
        auto res = ConfigLoader::parse(minimal_yaml("test:\n  - script: [run.sh]\n    timeout: 10000000000\n"));
        REQUIRE_THAT(res.error(), Catch::Matchers::ContainsSubstring("test[0].timeout"));

        REQUIRE(ConfigLoader::parse(minimal_yaml("test:\n  - script: [run.sh]\n    timeout: 86400\n")));
        REQUIRE_FALSE(ConfigLoader::parse(minimal_yaml("test:\n  - script: [run.sh]\n    timeout: 86401\n")));
    }

    SECTION("Non-integer timeout") {
        auto res = ConfigLoader::parse(minimal_yaml("test:\n  - script: [run.sh]\n    timeout: soon\n"));
        REQUIRE_THAT(res.error(), Catch::Matchers::ContainsSubstring("test[0].timeout"));
    }

    SECTION("Empty test list") {
        auto res = ConfigLoader::parse(minimal_yaml("test: []\n"));
        REQUIRE_THAT(res.error(), Catch::Matchers::ContainsSubstring("\"test\""));
    }

    SECTION("Missing guest entry") {
        auto res = ConfigLoader::parse(R"(host: {vmx_path: a, vmchecker_root: /, jobs_path: j, scripts_path: s}
test:
  - timeout: 1
)");
        REQUIRE_THAT(res.error(), Catch::Matchers::ContainsSubstring("guest"));
    }

    SECTION("Files must be lists") {
        auto res = ConfigLoader::parse(minimal_yaml("test:\n  - script: run.sh\n    timeout: 5\n"));
        REQUIRE_THAT(res.error(), Catch::Matchers::ContainsSubstring("test[0].script"));
    }

    SECTION("Root path without trailing separator") {
        std::string yaml = minimal_yaml(ONE_STAGE);
        yaml.replace(yaml.find("native_style: /home/so/"), 23, "native_style: /home/so");

        auto res = ConfigLoader::parse(yaml);
        REQUIRE_THAT(res.error(), Catch::Matchers::ContainsSubstring("guest.root_path"));
    }

    SECTION("Kernel monitor port out of range") {
        auto res = ConfigLoader::parse(minimal_yaml(ONE_STAGE, "km_port: 70000\n"));
        REQUIRE_THAT(res.error(), Catch::Matchers::ContainsSubstring("km_port"));
    }

    SECTION("km_enable must be a boolean") {
        auto res = ConfigLoader::parse(minimal_yaml(ONE_STAGE, "km_enable: sometimes\n"));
        REQUIRE_THAT(res.error(), Catch::Matchers::ContainsSubstring("km_enable"));
    }
}

TEST_CASE("Malformed YAML and unreadable files are reported") {
    REQUIRE_FALSE(ConfigLoader{config_dir / "malformed.yaml"}.read());
    REQUIRE_FALSE(ConfigLoader{config_dir / "does_not_exist.yaml"}.read());
    REQUIRE_FALSE(ConfigLoader::parse("- just\n- a list\n"));
}

TEST_CASE("Defaults apply to optional entries") {
    auto res = ConfigLoader::parse(minimal_yaml(ONE_STAGE));

    REQUIRE(res);
    REQUIRE(res.value().host.vmrun_path == "vmrun");
    REQUIRE(res.value().host.host_type == "ws");
    REQUIRE(res.value().host.jobs_path == path{"/root/jobs"});
    REQUIRE_FALSE(res.value().campaign.kernel_monitor());
}

TEST_CASE("The built-in example configuration is valid") {
    auto res = ConfigLoader::parse(ConfigLoader::example_yaml());

    REQUIRE(res);
    REQUIRE(res.value().campaign.stages().size() == 2);
}

#include "config/config_loader.hpp"

#include "campaign/test_campaign.hpp"
#include "common/expected.hpp"
#include "config/campaign_config.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "vm/guest_path.hpp"

#include <fmt/format.h>
#include <fmt/std.h>
#include <gsl/narrow>
#include <yaml-cpp/yaml.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace vmchecker {

namespace {

constexpr std::string_view EXAMPLE_YAML = R"(# Example campaign: build and run a submission on a Linux guest
host:
  vmx_path: /var/lib/vmchecker/vm/so-linux/so-linux.vmx
  vmchecker_root: /var/lib/vmchecker
  jobs_path: executor_jobs
  scripts_path: executor_scripts
guest:
  username: so
  password: so
  shell: /bin/bash
  root_path:
    native_style: /home/so/
    shell_style: /home/so/
    separator: /
test:
  - input: [file.zip, tests.zip]
    script: [build.sh]
    output: [build-stdout.vmr, build-stderr.vmr]
    timeout: 120
  - input: []
    script: [run.sh]
    output: [run-stdout.vmr, run-stderr.vmr]
    timeout: 120
km_enable: false
)";

// Longer limits overflow the nanosecond clock of the executor's wait
constexpr std::int64_t MAX_STAGE_TIMEOUT_SECONDS = 24 * 60 * 60;

std::string child_key(std::string_view parent, std::string_view key) {
    return parent.empty() ? std::string{key} : fmt::format("{}.{}", parent, key);
}

YAML::Node get_map(const YAML::Node& parent, std::string_view parent_key, const std::string& key) {
    YAML::Node node = parent[key];
    if (!node.IsDefined() || node.IsNull()) {
        throw ConfigError(fmt::format("missing required entry {:?}", child_key(parent_key, key)));
    }
    if (!node.IsMap()) {
        throw ConfigError(fmt::format("entry {:?} must be a mapping", child_key(parent_key, key)));
    }
    return node;
}

std::string get_string(const YAML::Node& parent, std::string_view parent_key, const std::string& key) {
    YAML::Node node = parent[key];
    if (!node.IsDefined() || node.IsNull()) {
        throw ConfigError(fmt::format("missing required entry {:?}", child_key(parent_key, key)));
    }
    if (!node.IsScalar() || node.Scalar().empty()) {
        throw ConfigError(fmt::format("entry {:?} must be a non-empty string", child_key(parent_key, key)));
    }
    return node.Scalar();
}

std::string get_string_or(const YAML::Node& parent, std::string_view parent_key, const std::string& key,
                          std::string_view default_value) {
    if (!parent[key].IsDefined()) {
        return std::string{default_value};
    }
    return get_string(parent, parent_key, key);
}

std::int64_t get_integer(const YAML::Node& node, const std::string& full_key) {
    if (!node.IsScalar()) {
        throw ConfigError(fmt::format("entry {:?} must be an integer", full_key));
    }
    try {
        return node.as<std::int64_t>();
    } catch (const YAML::BadConversion&) {
        throw ConfigError(fmt::format("entry {:?} must be an integer, got {:?}", full_key, node.Scalar()));
    }
}

std::vector<std::string> get_string_list(const YAML::Node& parent, std::string_view parent_key,
                                         const std::string& key) {
    YAML::Node node = parent[key];
    const std::string full_key = child_key(parent_key, key);

    // Absent or null = no files
    if (!node.IsDefined() || node.IsNull()) {
        return {};
    }
    if (!node.IsSequence()) {
        throw ConfigError(fmt::format("entry {:?} must be a list of file names", full_key));
    }

    std::vector<std::string> result;
    for (std::size_t i = 0; i < node.size(); ++i) {
        const YAML::Node& item = node[i];
        if (!item.IsScalar() || item.Scalar().empty()) {
            throw ConfigError(fmt::format("entry {}[{}] must be a non-empty file name", full_key, i));
        }
        result.push_back(item.Scalar());
    }
    return result;
}

std::filesystem::path resolve_against(const std::filesystem::path& base, const std::filesystem::path& path) {
    if (path.is_absolute()) {
        return path;
    }
    return base / path;
}

HostConfig parse_host(const YAML::Node& root) {
    const YAML::Node host = get_map(root, "", "host");

    HostConfig res;
    res.vmx_path = get_string(host, "host", "vmx_path");
    res.vmchecker_root = get_string(host, "host", "vmchecker_root");
    res.jobs_path = resolve_against(res.vmchecker_root, get_string(host, "host", "jobs_path"));
    res.scripts_path = resolve_against(res.vmchecker_root, get_string(host, "host", "scripts_path"));
    res.vmrun_path = get_string_or(host, "host", "vmrun_path", HostConfig::DEFAULT_VMRUN_PATH);
    res.host_type = get_string_or(host, "host", "host_type", HostConfig::DEFAULT_HOST_TYPE);

    return res;
}

GuestConfig parse_guest(const YAML::Node& root) {
    const YAML::Node guest = get_map(root, "", "guest");
    const YAML::Node root_path = get_map(guest, "guest", "root_path");

    auto guest_root = GuestRoot::make(get_string(root_path, "guest.root_path", "native_style"),
                                      get_string(root_path, "guest.root_path", "shell_style"),
                                      get_string(root_path, "guest.root_path", "separator"));
    if (!guest_root) {
        throw ConfigError(fmt::format("invalid entry \"guest.root_path\": {}", guest_root.error()));
    }

    return GuestConfig{
        .credentials = {.username = get_string(guest, "guest", "username"),
                        .password = get_string(guest, "guest", "password")},
        .shell = get_string(guest, "guest", "shell"),
        .root = std::move(guest_root.value()),
    };
}

TestStage parse_stage(const YAML::Node& node, std::size_t index) {
    const std::string key = fmt::format("test[{}]", index);

    if (!node.IsMap()) {
        throw ConfigError(fmt::format("entry {:?} must be a mapping", key));
    }

    const YAML::Node timeout_node = node["timeout"];
    if (!timeout_node.IsDefined() || timeout_node.IsNull()) {
        throw ConfigError(fmt::format("missing required entry {:?}", key + ".timeout"));
    }

    const std::int64_t timeout = get_integer(timeout_node, key + ".timeout");
    if (timeout <= 0) {
        throw ConfigError(fmt::format("entry {:?} must be a positive number of seconds, got {}", key + ".timeout",
                                      timeout));
    }
    if (timeout > MAX_STAGE_TIMEOUT_SECONDS) {
        throw ConfigError(fmt::format("entry {:?} must be at most {} seconds (one day), got {}", key + ".timeout",
                                      MAX_STAGE_TIMEOUT_SECONDS, timeout));
    }

    return TestStage{
        .input_files = get_string_list(node, key, "input"),
        .script_files = get_string_list(node, key, "script"),
        .output_files = get_string_list(node, key, "output"),
        .timeout = std::chrono::seconds{timeout},
    };
}

std::vector<TestStage> parse_stages(const YAML::Node& root) {
    const YAML::Node tests = root["test"];

    if (!tests.IsDefined() || tests.IsNull()) {
        throw ConfigError("missing required entry \"test\"");
    }
    if (!tests.IsSequence() || tests.size() == 0) {
        throw ConfigError("entry \"test\" must be a non-empty list of stages");
    }

    std::vector<TestStage> stages;
    for (std::size_t i = 0; i < tests.size(); ++i) {
        stages.push_back(parse_stage(tests[i], i));
    }
    return stages;
}

bool parse_km_enable(const YAML::Node& root) {
    const YAML::Node node = root["km_enable"];
    if (!node.IsDefined() || node.IsNull()) {
        return false;
    }
    try {
        return node.as<bool>();
    } catch (const YAML::BadConversion&) {
        throw ConfigError("entry \"km_enable\" must be a boolean");
    }
}

KernelMonitorConfig parse_kernel_monitor(const YAML::Node& root, const HostConfig& host) {
    KernelMonitorConfig res;

    if (const YAML::Node port = root["km_port"]; port.IsDefined() && !port.IsNull()) {
        const std::int64_t value = get_integer(port, "km_port");
        if (value <= 0 || value > std::numeric_limits<std::uint16_t>::max()) {
            throw ConfigError(fmt::format("entry \"km_port\" must be a port number, got {}", value));
        }
        res.port = gsl::narrow<std::uint16_t>(value);
    }

    res.log_path = resolve_against(host.jobs_path,
                                   get_string_or(root, "", "km_log", KernelMonitorConfig::DEFAULT_LOG_NAME));

    return res;
}

CampaignConfig parse_root(const YAML::Node& root) {
    if (!root.IsMap()) {
        throw ConfigError("configuration must be a mapping");
    }

    HostConfig host = parse_host(root);
    GuestConfig guest = parse_guest(root);
    TestCampaign campaign{parse_stages(root), parse_km_enable(root)};
    KernelMonitorConfig kernel_monitor = parse_kernel_monitor(root, host);

    return CampaignConfig{
        .host = std::move(host),
        .guest = std::move(guest),
        .campaign = std::move(campaign),
        .kernel_monitor = std::move(kernel_monitor),
    };
}

} // namespace

ConfigLoader::ConfigLoader(std::filesystem::path path)
    : path_{std::move(path)} {}

Expected<CampaignConfig, std::string> ConfigLoader::read() const {
    std::ifstream in_file{path_};

    if (not in_file.is_open()) {
        return fmt::format("Failed to open configuration file {}", path_);
    }

    std::stringstream contents;
    contents << in_file.rdbuf();

    if (in_file.bad()) {
        return fmt::format("IO error in reading {}", path_);
    }

    LOG_DEBUG("Read configuration file {}", path_);

    return parse(contents.str());
}

Expected<CampaignConfig, std::string> ConfigLoader::parse(std::string_view yaml_text) {
    try {
        return parse_root(YAML::Load(std::string{yaml_text}));
    } catch (const ConfigError& ex) {
        return std::string{ex.what()};
    } catch (const YAML::Exception& ex) {
        return fmt::format("malformed YAML: {}", ex.what());
    }
}

std::string_view ConfigLoader::example_yaml() {
    return EXAMPLE_YAML;
}

} // namespace vmchecker

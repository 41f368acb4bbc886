#pragma once

#include <vmchecker/common/expected.hpp>
#include <vmchecker/config/campaign_config.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace vmchecker {

/// Reads and validates a campaign configuration (YAML).
///
/// Schema:
///   host:  {vmx_path, vmchecker_root, jobs_path, scripts_path, [vmrun_path], [host_type]}
///   guest: {username, password, shell, root_path: {native_style, shell_style, separator}}
///   test:  [{[input: [...]], [script: [...]], [output: [...]], timeout: int > 0}, ...]   (non-empty)
///   [km_enable: bool], [km_port: int], [km_log: path]
///
/// Relative jobs/scripts paths are resolved against vmchecker_root, and a relative km_log against
/// the jobs path. Any missing or malformed entry fails the whole load, naming the entry.
class ConfigLoader
{
public:
    explicit ConfigLoader(std::filesystem::path path);

    Expected<CampaignConfig, std::string> read() const;

    static Expected<CampaignConfig, std::string> parse(std::string_view yaml_text);

    /// Built-in example configuration, run by --example and printed by --print-example
    static std::string_view example_yaml();

private:
    std::filesystem::path path_;
};

} // namespace vmchecker

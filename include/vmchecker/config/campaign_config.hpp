#pragma once

#include <vmchecker/campaign/test_campaign.hpp>
#include <vmchecker/vm/driver.hpp>
#include <vmchecker/vm/guest_path.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace vmchecker {

struct HostConfig
{
    /// Identifier of the VM, handed to the driver as-is
    std::string vmx_path;
    std::filesystem::path vmchecker_root;
    /// Inputs are read from here and outputs written back here
    std::filesystem::path jobs_path;
    std::filesystem::path scripts_path;

    std::string vmrun_path = std::string{DEFAULT_VMRUN_PATH};
    std::string host_type = std::string{DEFAULT_HOST_TYPE};

    static constexpr std::string_view DEFAULT_VMRUN_PATH = "vmrun";
    static constexpr std::string_view DEFAULT_HOST_TYPE = "ws";
};

struct GuestConfig
{
    GuestCredentials credentials;
    /// Shell used to run every script as a login shell, e.g. "/bin/bash"
    std::string shell;
    GuestRoot root;
};

struct KernelMonitorConfig
{
    std::uint16_t port = DEFAULT_PORT;
    std::filesystem::path log_path;

    static constexpr std::uint16_t DEFAULT_PORT = 6666;
    static constexpr std::string_view DEFAULT_LOG_NAME = "kernel_messages.log";
};

/// Everything needed for one campaign run. Built once, before the run, and never modified
struct CampaignConfig
{
    HostConfig host;
    GuestConfig guest;
    TestCampaign campaign;
    KernelMonitorConfig kernel_monitor;
};

} // namespace vmchecker

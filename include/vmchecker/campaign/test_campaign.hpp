#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace vmchecker {

/// One copy-in + run + copy-out unit. All file names are relative to the host jobs/scripts
/// directories and to the guest root directory
struct TestStage
{
    std::vector<std::string> input_files;
    std::vector<std::string> script_files;
    std::vector<std::string> output_files;

    /// Applies to each script of the stage individually
    std::chrono::seconds timeout;
};

/// An ordered sequence of stages plus the kernel-monitor flag. Read-only once constructed
class TestCampaign
{
public:
    TestCampaign(std::vector<TestStage> stages, bool kernel_monitor)
        : stages_{std::move(stages)}
        , kernel_monitor_{kernel_monitor} {}

    const std::vector<TestStage>& stages() const { return stages_; }

    bool kernel_monitor() const { return kernel_monitor_; }

private:
    std::vector<TestStage> stages_;
    bool kernel_monitor_;
};

} // namespace vmchecker

#pragma once

#include <vmchecker/campaign/outcome.hpp>
#include <vmchecker/campaign/test_campaign.hpp>
#include <vmchecker/vm/guest_path.hpp>
#include <vmchecker/vm/guest_session.hpp>

#include <cstddef>
#include <filesystem>
#include <string>

namespace vmchecker {

/// Runs a single TestStage against a logged-in guest, strictly in this order:
///   1. copy the stage's inputs from the host jobs directory to the guest root
///   2. copy the stage's scripts from the host scripts directory to the guest root
///   3. for each script: make it executable and run it under the stage timeout, then copy the
///      stage's outputs back to the jobs directory whatever the result; stop at the first timeout
///
/// The stage passes only if every script completed within its timeout. A script's exit code is
/// logged but does not affect the result.
class StageRunner
{
public:
    StageRunner(const GuestSession& session, GuestRoot guest_root, std::string shell_path);

    /// \throws TransportError if a copy fails outright
    StageOutcome run_stage(const std::filesystem::path& host_jobs_dir, const std::filesystem::path& host_scripts_dir,
                           const TestStage& stage, std::size_t index = 0) const;

private:
    const GuestSession* session_;
    GuestRoot guest_root_;
    std::string shell_path_;
};

} // namespace vmchecker

#include "campaign/stage_runner.hpp"

#include "campaign/outcome.hpp"
#include "campaign/test_campaign.hpp"
#include "exec/bounded_executor.hpp"
#include "logging.hpp"
#include "transfer/file_transfer.hpp"
#include "vm/guest_path.hpp"
#include "vm/guest_session.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <tuple>
#include <utility>

namespace vmchecker {

StageRunner::StageRunner(const GuestSession& session, GuestRoot guest_root, std::string shell_path)
    : session_{&session}
    , guest_root_{std::move(guest_root)}
    , shell_path_{std::move(shell_path)} {}

StageOutcome StageRunner::run_stage(const std::filesystem::path& host_jobs_dir,
                                    const std::filesystem::path& host_scripts_dir, const TestStage& stage,
                                    std::size_t index) const {
    const FileTransferBridge transfer{*session_};
    const BoundedExecutor executor{*session_};

    StageOutcome outcome{.index = index, .passed = true, .scripts_attempted = {}, .timed_out_script = std::nullopt};

    LOG_INFO("Stage #{}: inputs={} scripts={} outputs={} timeout={}", index, stage.input_files, stage.script_files,
             stage.output_files, stage.timeout);

    std::ignore = transfer.copy_in(host_jobs_dir, guest_root_.native_style(), stage.input_files);
    std::ignore = transfer.copy_in(host_scripts_dir, guest_root_.native_style(), stage.script_files);

    for (const std::string& script : stage.script_files) {
        outcome.scripts_attempted.push_back(script);

        const ExecResult result = executor.run_script(shell_path_, guest_root_.shell_path(script), stage.timeout);

        // Collected regardless of the result; partial logs are what explain a timeout
        std::ignore = transfer.copy_out(host_jobs_dir, guest_root_.native_style(), stage.output_files);

        if (!result.completed()) {
            LOG_WARN("Stage #{}: script {:?} timed out ({}); skipping the remaining scripts", index, script,
                     result.get_reason());
            outcome.passed = false;
            outcome.timed_out_script = script;
            break;
        }

        if (result.get_exit_code() != 0) {
            LOG_INFO("Stage #{}: script {:?} exited with code {}", index, script, result.get_exit_code().value_or(-1));
        }
    }

    LOG_INFO("Stage #{} {}", index, outcome.passed ? "passed" : "failed");

    return outcome;
}

} // namespace vmchecker

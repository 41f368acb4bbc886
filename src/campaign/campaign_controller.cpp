#include "campaign/campaign_controller.hpp"

#include "campaign/kernel_listener.hpp"
#include "campaign/outcome.hpp"
#include "campaign/stage_runner.hpp"
#include "config/campaign_config.hpp"
#include "logging.hpp"
#include "vm/connection_manager.hpp"
#include "vm/guest_session.hpp"
#include "vm/snapshot_controller.hpp"

#include <fmt/format.h>
#include <gsl/util>
#include <libassert/assert.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <utility>

namespace vmchecker {

CampaignController::CampaignController(std::shared_ptr<VirtualizationDriver> driver,
                                       std::unique_ptr<KernelListener> kernel_listener)
    : driver_{std::move(driver)}
    , kernel_listener_{std::move(kernel_listener)} {
    ASSERT(driver_ != nullptr);
}

void CampaignController::transition(CampaignState next) {
    DEBUG_ASSERT(!is_terminal(state_), "Campaign state machine left a terminal state", state_, next);

    if (next == CampaignState::Running) {
        LOG_DEBUG("Campaign state: {} -> {}({})", state_, next, current_stage_.value_or(0));
    } else {
        LOG_DEBUG("Campaign state: {} -> {}", state_, next);
    }

    state_ = next;
}

CampaignOutcome CampaignController::run(const CampaignConfig& config) {
    state_ = CampaignState::Idle;
    current_stage_.reset();

    const auto& stages = config.campaign.stages();

    CampaignOutcome outcome;
    outcome.num_stages_total = stages.size();

    // Destruction order tears down the session before the VM handle
    const VmHandle vm = ConnectionManager{driver_}.open(config.host.vmx_path);
    transition(CampaignState::Connected);

    SnapshotController{vm}.revert_to_latest();
    transition(CampaignState::Reverted);

    const GuestSession session = GuestSession::establish(vm, config.guest.credentials);
    transition(CampaignState::LoggedIn);

    const bool monitor_kernel = config.campaign.kernel_monitor();
    if (monitor_kernel && kernel_listener_ == nullptr) {
        LOG_WARN("Kernel monitoring is enabled, but no kernel listener was provided");
    }

    KernelListener* listener = monitor_kernel ? kernel_listener_.get() : nullptr;
    if (listener != nullptr) {
        LOG_INFO("Starting kernel listener");
        listener->start();
    }

    // Runs after the last attempted stage, whether the campaign completed, aborted, or threw
    auto stop_listener = gsl::finally([listener] {
        if (listener != nullptr) {
            LOG_INFO("Stopping kernel listener");
            listener->stop();
        }
    });

    const StageRunner runner{session, config.guest.root, config.guest.shell};

    try {
        for (std::size_t i = 0; i < stages.size(); ++i) {
            current_stage_ = i;
            transition(CampaignState::Running);

            StageOutcome stage_outcome = runner.run_stage(config.host.jobs_path, config.host.scripts_path, stages[i], i);
            const bool passed = stage_outcome.passed;
            outcome.stage_outcomes.push_back(std::move(stage_outcome));

            if (!passed) {
                LOG_WARN("Stage #{} failed; skipping the remaining {} stage(s)", i, stages.size() - i - 1);
                transition(CampaignState::Aborted);
                break;
            }
        }
    } catch (...) {
        // Not handled here; only recorded so the state machine ends in a terminal state
        transition(CampaignState::Aborted);
        throw;
    }

    if (state_ != CampaignState::Aborted) {
        transition(CampaignState::Completed);
    }

    outcome.final_state = state_;

    LOG_INFO("Campaign {}: {}/{} stage(s) passed", outcome.passed() ? "passed" : "failed", outcome.num_stages_passed(),
             outcome.num_stages_total);

    return outcome;
}

} // namespace vmchecker

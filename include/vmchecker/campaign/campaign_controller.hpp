#pragma once

#include <vmchecker/campaign/kernel_listener.hpp>
#include <vmchecker/campaign/outcome.hpp>
#include <vmchecker/config/campaign_config.hpp>
#include <vmchecker/vm/driver.hpp>

#include <cstddef>
#include <memory>
#include <optional>

namespace vmchecker {

/// Drives one VM through a whole campaign:
///   open VM -> revert to the latest snapshot -> wait for tools + log in -> [start kernel listener]
///   -> run each stage in order, stopping at the first failed stage -> [stop kernel listener]
///
/// The VM handle and guest session are torn down when run() returns or throws. The kernel listener,
/// if the campaign enables it, is started once before the first stage and stopped once after the
/// last attempted one, including when a stage fails or an exception escapes.
///
/// There is no retry and no re-revert in the middle of a run.
class CampaignController
{
public:
    explicit CampaignController(std::shared_ptr<VirtualizationDriver> driver,
                                std::unique_ptr<KernelListener> kernel_listener = nullptr);

    /// \throws ConnectionError, SnapshotOutOfRange, SnapshotError, GuestLoginError, TransportError
    CampaignOutcome run(const CampaignConfig& config);

    CampaignState get_state() const { return state_; }

    /// Index of the stage being run (state Running), or the last stage attempted (Aborted/Completed)
    std::optional<std::size_t> get_current_stage() const { return current_stage_; }

private:
    void transition(CampaignState next);

    std::shared_ptr<VirtualizationDriver> driver_;
    std::unique_ptr<KernelListener> kernel_listener_;

    CampaignState state_ = CampaignState::Idle;
    std::optional<std::size_t> current_stage_;
};

} // namespace vmchecker

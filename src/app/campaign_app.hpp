#pragma once

#include "app/app.hpp" // IWYU pragma: export
#include "campaign/outcome.hpp"
#include "common/expected.hpp"
#include "config/campaign_config.hpp"

#include <string>

namespace vmchecker {

/// Loads the configuration named on the command line (or the built-in example) and runs its campaign
/// against a vmrun-driven VM
class CampaignApp final : public App
{
public:
    using App::App;

    /// Exit status for a finished campaign, honouring --always-exit-zero
    int exit_code_for(const CampaignOutcome& outcome) const;

private:
    int run_impl() override;

    int exit_with(int code) const;

    Expected<CampaignConfig, std::string> load_config() const;
};

} // namespace vmchecker

#include "catch2_custom.hpp"

#include "app/campaign_app.hpp"
#include "campaign/outcome.hpp"
#include "user/program_options.hpp"

#include <cstddef>
#include <filesystem>
#include <utility>

using namespace vmchecker;

namespace {

CampaignOutcome make_outcome(CampaignState final_state, std::size_t num_passed, std::size_t num_total) {
    CampaignOutcome outcome;
    outcome.num_stages_total = num_total;
    outcome.final_state = final_state;
    for (std::size_t i = 0; i < num_passed; ++i) {
        outcome.stage_outcomes.push_back(StageOutcome{.index = i, .passed = true});
    }
    if (final_state == CampaignState::Aborted) {
        outcome.stage_outcomes.push_back(
            StageOutcome{.index = num_passed, .passed = false, .scripts_attempted = {"run.sh"}, .timed_out_script = "run.sh"});
    }
    return outcome;
}

} // namespace

TEST_CASE("Exit codes distinguish passed and failed campaigns") {
    const CampaignApp app{ProgramOptions{}};

    REQUIRE(app.exit_code_for(make_outcome(CampaignState::Completed, 2, 2)) == CAMPAIGN_PASSED);
    REQUIRE(app.exit_code_for(make_outcome(CampaignState::Aborted, 1, 3)) == STAGE_FAILED);
}

TEST_CASE("--always-exit-zero maps every outcome to 0") {
    ProgramOptions opts;
    opts.always_exit_zero = true;
    const CampaignApp app{std::move(opts)};

    REQUIRE(app.exit_code_for(make_outcome(CampaignState::Aborted, 0, 2)) == 0);
}

TEST_CASE("--print-example prints a configuration without touching any VM") {
    ProgramOptions opts;
    opts.print_example = true;
    CampaignApp app{std::move(opts)};

    REQUIRE(app.run() == CAMPAIGN_PASSED);
}

TEST_CASE("--example runs the built-in configuration") {
    ProgramOptions opts;
    opts.use_example = true;
    CampaignApp app{std::move(opts)};

    // The example is valid, so the run gets past loading and fails on the (absent) example VM
    REQUIRE(app.run() == FATAL_ERROR);
}

TEST_CASE("An invalid configuration is a usage error") {
    ProgramOptions opts;
    opts.config_path = std::filesystem::path{RESOURCES_DIR} / "config" / "missing_timeout.yaml";
    CampaignApp app{std::move(opts)};

    REQUIRE(app.run() == USAGE_ERROR);
}

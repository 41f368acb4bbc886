#include "catch2_custom.hpp"

#include "campaign/campaign_controller.hpp"
#include "campaign/outcome.hpp"
#include "campaign/test_campaign.hpp"
#include "config/campaign_config.hpp"
#include "exceptions.hpp"
#include "fake_driver.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace vmchecker;
using namespace std::chrono_literals;

namespace {

struct CampaignFixture
{
    std::shared_ptr<FakeDriver> driver = std::make_shared<FakeDriver>();
    TempDir jobs;
    TempDir scripts;
    TempDir guest;

    CampaignFixture() {
        scripts.write("a.sh");
        scripts.write("b.sh");
        driver->snapshots = {"clean", "ready"};
    }

    CampaignConfig make_config(std::vector<TestStage> stages, bool kernel_monitor = false) const {
        return CampaignConfig{
            .host = HostConfig{.vmx_path = "so.vmx",
                               .vmchecker_root = jobs.path(),
                               .jobs_path = jobs.path(),
                               .scripts_path = scripts.path()},
            .guest = GuestConfig{.credentials = {.username = "so", .password = "so"},
                                 .shell = "/bin/bash",
                                 .root = make_guest_root(guest.path())},
            .campaign = TestCampaign{std::move(stages), kernel_monitor},
            .kernel_monitor = KernelMonitorConfig{},
        };
    }

    std::string in_guest(const std::string& file) const { return (guest.path() / file).string(); }

    static TestStage stage(const std::string& script, std::vector<std::string> outputs = {}) {
        return TestStage{.input_files = {}, .script_files = {script}, .output_files = std::move(outputs), .timeout = 1s};
    }

    /// Index of the first call that runs ``script``
    std::size_t run_index(const std::string& script) const {
        const auto calls = driver->calls();
        for (std::size_t i = 0; i < calls.size(); ++i) {
            if (calls[i].starts_with("run:") && calls[i].find(script) != std::string::npos) {
                return i;
            }
        }
        FAIL("script " << script << " was never run");
        return 0;
    }
};

} // namespace

TEST_CASE_METHOD(CampaignFixture, "All stages run in order when each finishes within its timeout") {
    driver->programs["a.sh"] = {.runtime = 50ms};
    driver->programs["b.sh"] = {.runtime = 50ms};

    CampaignController controller{driver};
    const CampaignOutcome outcome = controller.run(make_config({stage("a.sh"), stage("b.sh")}));

    REQUIRE(outcome.passed());
    REQUIRE(outcome.final_state == CampaignState::Completed);
    REQUIRE(outcome.num_stages_total == 2);
    REQUIRE(outcome.num_stages_passed() == 2);
    REQUIRE(controller.get_state() == CampaignState::Completed);
    REQUIRE(controller.get_current_stage() == 1);

    REQUIRE(run_index("a.sh") < run_index("b.sh"));

    // Reverted to the latest snapshot before logging in
    REQUIRE(driver->index_of("revert:ready").value() < driver->index_of("login:so").value());
}

TEST_CASE_METHOD(CampaignFixture, "A timed out stage aborts the campaign, after collecting its outputs") {
    driver->programs["a.sh"] = {.runtime = 2500ms, .creates = {in_guest("a.vmr")}};

    CampaignController controller{driver};
    const CampaignOutcome outcome = controller.run(make_config({stage("a.sh", {"a.vmr"}), stage("b.sh")}));

    REQUIRE_FALSE(outcome.passed());
    REQUIRE(outcome.final_state == CampaignState::Aborted);
    REQUIRE(outcome.stage_outcomes.size() == 1);
    REQUIRE(outcome.stage_outcomes.front().timed_out_script == "a.sh");
    REQUIRE(controller.get_current_stage() == 0);

    REQUIRE(std::filesystem::exists(jobs.path() / "a.vmr"));
    REQUIRE(driver->count("copy_in:b.sh") == 0);
}

TEST_CASE_METHOD(CampaignFixture, "The VM is torn down after the last stage: logout, close, disconnect") {
    CampaignController controller{driver};
    REQUIRE(controller.run(make_config({stage("a.sh")})).passed());

    const auto logout = driver->index_of("logout").value();
    const auto close = driver->index_of("close_vm").value();
    const auto disconnect = driver->index_of("disconnect_host").value();

    REQUIRE(run_index("a.sh") < logout);
    REQUIRE(logout < close);
    REQUIRE(close < disconnect);
}

TEST_CASE_METHOD(CampaignFixture, "The kernel listener brackets the stages exactly once") {
    SECTION("Campaign completes") {
        CampaignController controller{driver, std::make_unique<FakeKernelListener>(driver)};
        REQUIRE(controller.run(make_config({stage("a.sh"), stage("b.sh")}, true)).passed());
    }

    SECTION("Campaign aborts") {
        driver->programs["a.sh"] = {.runtime = 2500ms};

        CampaignController controller{driver, std::make_unique<FakeKernelListener>(driver)};
        REQUIRE_FALSE(controller.run(make_config({stage("a.sh"), stage("b.sh")}, true)).passed());
    }

    SECTION("A stage throws") {
        driver->copy_in_error = ErrorKind::TransferFailed;

        CampaignController controller{driver, std::make_unique<FakeKernelListener>(driver)};
        REQUIRE_THROWS_AS(controller.run(make_config({stage("a.sh")}, true)), TransportError);
        REQUIRE(controller.get_state() == CampaignState::Aborted);
    }

    REQUIRE(driver->count("km_start") == 1);
    REQUIRE(driver->count("km_stop") == 1);

    const auto start = driver->index_of("km_start").value();
    const auto stop = driver->index_of("km_stop").value();

    REQUIRE(driver->index_of("login:so").value() < start);
    REQUIRE(start < stop);
    REQUIRE(stop < driver->index_of("logout").value());
}

TEST_CASE_METHOD(CampaignFixture, "The kernel listener is left alone when monitoring is disabled") {
    CampaignController controller{driver, std::make_unique<FakeKernelListener>(driver)};
    REQUIRE(controller.run(make_config({stage("a.sh")}, false)).passed());

    REQUIRE(driver->count("km_start") == 0);
    REQUIRE(driver->count("km_stop") == 0);
}

TEST_CASE_METHOD(CampaignFixture, "Setup failures propagate, and whatever was opened is closed") {
    CampaignController controller{driver};

    SECTION("Host unreachable") {
        driver->connect_error = ErrorKind::HostUnreachable;
        REQUIRE_THROWS_AS(controller.run(make_config({stage("a.sh")})), ConnectionError);
        REQUIRE(driver->count("close_vm") == 0);
    }

    SECTION("No snapshots") {
        driver->snapshots.clear();
        REQUIRE_THROWS_AS(controller.run(make_config({stage("a.sh")})), SnapshotOutOfRange);
        REQUIRE(driver->count("close_vm") == 1);
        REQUIRE(driver->count("disconnect_host") == 1);
    }

    SECTION("Login rejected") {
        driver->login_error = ErrorKind::AuthenticationRejected;
        REQUIRE_THROWS_AS(controller.run(make_config({stage("a.sh")})), GuestLoginError);
        REQUIRE(driver->count("logout") == 0);
        REQUIRE(driver->count("close_vm") == 1);
    }

    const auto calls = driver->calls();
    REQUIRE(std::ranges::none_of(calls, [](const std::string& call) { return call.starts_with("run:"); }));
}

TEST_CASE("Campaign states are formatted by name") {
    REQUIRE(fmt::format("{}", CampaignState::LoggedIn) == "LoggedIn");
    REQUIRE(is_terminal(CampaignState::Aborted));
    REQUIRE_FALSE(is_terminal(CampaignState::Running));
}

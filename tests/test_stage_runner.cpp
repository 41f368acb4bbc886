#include "catch2_custom.hpp"

#include "campaign/outcome.hpp"
#include "campaign/stage_runner.hpp"
#include "campaign/test_campaign.hpp"
#include "fake_driver.hpp"
#include "vm/connection_manager.hpp"
#include "vm/guest_session.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

using namespace vmchecker;
using namespace std::chrono_literals;

namespace {

struct StageFixture
{
    std::shared_ptr<FakeDriver> driver = std::make_shared<FakeDriver>();
    TempDir jobs;
    TempDir scripts;
    TempDir guest;
    VmHandle vm = ConnectionManager{driver}.open("so.vmx");
    GuestSession session = GuestSession::establish(vm, {.username = "so", .password = "so"});
    StageRunner runner{session, make_guest_root(guest.path()), "/bin/bash"};

    std::string in_guest(const std::string& file) const { return (guest.path() / file).string(); }
};

} // namespace

TEST_CASE_METHOD(StageFixture, "A stage copies inputs and scripts in, runs every script, and copies outputs out") {
    jobs.write("file.zip", "submission");
    scripts.write("build.sh", "make");
    scripts.write("run.sh", "./a.out");

    driver->programs["build.sh"] = {.creates = {in_guest("build-stdout.vmr")}};
    driver->programs["run.sh"] = {.creates = {in_guest("run-stdout.vmr")}};

    const TestStage stage{.input_files = {"file.zip"},
                          .script_files = {"build.sh", "run.sh"},
                          .output_files = {"build-stdout.vmr", "run-stdout.vmr"},
                          .timeout = 5s};

    const StageOutcome outcome = runner.run_stage(jobs.path(), scripts.path(), stage, 2);

    REQUIRE(outcome.passed);
    REQUIRE(outcome.index == 2);
    REQUIRE(outcome.scripts_attempted == std::vector<std::string>{"build.sh", "run.sh"});
    REQUIRE_FALSE(outcome.timed_out_script.has_value());

    REQUIRE(std::filesystem::exists(guest.path() / "file.zip"));
    REQUIRE(std::filesystem::exists(guest.path() / "build.sh"));
    REQUIRE(std::filesystem::exists(jobs.path() / "build-stdout.vmr"));
    REQUIRE(std::filesystem::exists(jobs.path() / "run-stdout.vmr"));

    // Inputs before scripts, scripts before any run
    REQUIRE(driver->index_of("copy_in:file.zip").value() < driver->index_of("copy_in:build.sh").value());
    REQUIRE(driver->index_of("copy_in:run.sh").value() < driver->index_of("copy_out:build-stdout.vmr").value());
}

TEST_CASE_METHOD(StageFixture, "Outputs are collected even when a script times out, and later scripts are skipped") {
    scripts.write("hang.sh");
    scripts.write("never.sh");

    driver->programs["hang.sh"] = {.runtime = 2500ms, .creates = {in_guest("partial.vmr")}};

    const TestStage stage{
        .input_files = {}, .script_files = {"hang.sh", "never.sh"}, .output_files = {"partial.vmr"}, .timeout = 1s};

    const StageOutcome outcome = runner.run_stage(jobs.path(), scripts.path(), stage);

    REQUIRE_FALSE(outcome.passed);
    REQUIRE(outcome.timed_out_script == "hang.sh");
    REQUIRE(outcome.scripts_attempted == std::vector<std::string>{"hang.sh"});

    REQUIRE(std::filesystem::exists(jobs.path() / "partial.vmr"));
    REQUIRE(driver->count("copy_out:partial.vmr") == 1);

    for (const auto& call : driver->calls()) {
        REQUIRE_THAT(call, !Catch::Matchers::ContainsSubstring("never.sh; "));
    }
}

TEST_CASE_METHOD(StageFixture, "Non-zero script exit codes do not fail the stage") {
    scripts.write("check.sh");
    driver->programs["check.sh"] = {.exit_code = 1};

    const TestStage stage{.input_files = {}, .script_files = {"check.sh"}, .output_files = {}, .timeout = 5s};

    REQUIRE(runner.run_stage(jobs.path(), scripts.path(), stage).passed);
}

TEST_CASE_METHOD(StageFixture, "Missing inputs are skipped without failing the stage") {
    scripts.write("run.sh");

    const TestStage stage{
        .input_files = {"does-not-exist.zip"}, .script_files = {"run.sh"}, .output_files = {}, .timeout = 5s};

    const StageOutcome outcome = runner.run_stage(jobs.path(), scripts.path(), stage);

    REQUIRE(outcome.passed);
    REQUIRE(driver->count("copy_in:does-not-exist.zip") == 0);
    REQUIRE(driver->count("copy_in:run.sh") == 1);
}

#include "app/campaign_app.hpp"

#include "campaign/campaign_controller.hpp"
#include "campaign/kernel_listener.hpp"
#include "campaign/outcome.hpp"
#include "common/expected.hpp"
#include "config/campaign_config.hpp"
#include "config/config_loader.hpp"
#include "drivers/vmrun_driver.hpp"
#include "exceptions.hpp"
#include "listener/udp_kernel_listener.hpp"
#include "logging.hpp"

#include <fmt/base.h>
#include <fmt/color.h>
#include <fmt/format.h>
#include <fmt/std.h>

#include <cstddef>
#include <string>
#include <memory>
#include <utility>

namespace vmchecker {

namespace {

void print_summary(const CampaignOutcome& outcome) {
    for (const StageOutcome& stage : outcome.stage_outcomes) {
        if (stage.passed) {
            fmt::println("Stage #{}: {} ({} script(s))", stage.index, styled("passed", fg(fmt::color::green)),
                         stage.scripts_attempted.size());
        } else {
            fmt::println("Stage #{}: {} (timed out running {:?})", stage.index, styled("failed", fg(fmt::color::red)),
                         stage.timed_out_script.value_or("<unknown>"));
        }
    }

    for (std::size_t i = outcome.stage_outcomes.size(); i < outcome.num_stages_total; ++i) {
        fmt::println("Stage #{}: skipped", i);
    }

    fmt::println("{}/{} stage(s) passed", outcome.num_stages_passed(), outcome.num_stages_total);
}

} // namespace

int CampaignApp::exit_with(int code) const {
    return OPTS.always_exit_zero ? CAMPAIGN_PASSED : code;
}

int CampaignApp::exit_code_for(const CampaignOutcome& outcome) const {
    return exit_with(outcome.passed() ? CAMPAIGN_PASSED : STAGE_FAILED);
}

Expected<CampaignConfig, std::string> CampaignApp::load_config() const {
    if (OPTS.use_example) {
        LOG_INFO("Using the built-in example configuration");
        return ConfigLoader::parse(ConfigLoader::example_yaml());
    }

    auto config = ConfigLoader{OPTS.config_path.value()}.read();
    if (!config) {
        return fmt::format("{}: {}", OPTS.config_path.value(), config.error());
    }
    return config;
}

int CampaignApp::run_impl() {
    if (OPTS.print_example) {
        fmt::print("{}", ConfigLoader::example_yaml());
        return CAMPAIGN_PASSED;
    }

    auto config = load_config();
    if (!config) {
        LOG_ERROR("Invalid configuration: {}", config.error());
        return exit_with(USAGE_ERROR);
    }

    const HostConfig& host = config.value().host;

    auto driver = std::make_shared<VmrunDriver>(host.vmrun_path, host.host_type);

    std::unique_ptr<KernelListener> listener;
    if (config.value().campaign.kernel_monitor()) {
        const KernelMonitorConfig& km = config.value().kernel_monitor;
        listener = std::make_unique<UdpKernelListener>(km.port, km.log_path);
    }

    CampaignController controller{std::move(driver), std::move(listener)};

    try {
        CampaignOutcome outcome = controller.run(config.value());
        print_summary(outcome);

        return exit_code_for(outcome);
    } catch (const VmcheckerError& ex) {
        LOG_FATAL("Campaign stopped in state {}: {}", controller.get_state(), ex);
        return exit_with(FATAL_ERROR);
    }
}

} // namespace vmchecker

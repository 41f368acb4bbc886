#include "app/campaign_app.hpp"
#include "logging.hpp"
#include "user/cl_args.hpp"
#include "user/program_options.hpp"

#include <cstddef>
#include <span>
#include <utility>

int main(int argc, const char* argv[]) {
    vmchecker::init_loggers();

    std::span<const char*> args{argv, static_cast<std::size_t>(argc)};

    vmchecker::ProgramOptions options = vmchecker::parse_args_or_exit(args, vmchecker::USAGE_ERROR);

    vmchecker::adjust_log_level(options.verbosity_delta);

    vmchecker::CampaignApp app{std::move(options)};

    return app.run();
}

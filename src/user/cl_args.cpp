#include "user/cl_args.hpp"

#include "common/expected.hpp"
#include "logging.hpp"
#include "user/program_options.hpp"
#include "version.hpp"

#include <argparse/argparse.hpp>
#include <fmt/base.h>
#include <fmt/color.h>
#include <fmt/format.h>

#include <cstddef>
#include <cstdlib>
#include <exception>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace vmchecker {

CommandLineArgs::CommandLineArgs(std::span<const char*> args)
    : arg_parser_{get_basename(args[0]), /*unused*/ VMCHECKER_VERSION_STRING, argparse::default_arguments::help}
    , args_{args.begin(), args.end()} {
    // Add parser arguments
    setup_parser();
}

void CommandLineArgs::setup_parser() {
    constexpr std::size_t MAX_LINE_WIDTH = 100;
    arg_parser_.set_usage_max_line_width(MAX_LINE_WIDTH);

    arg_parser_.add_description(
        fmt::format("vmchecker v{}\nRuns a staged test campaign inside a freshly reverted virtual machine.",
                    VMCHECKER_VERSION_STRING));
    arg_parser_.add_epilog("Exit status: 0 = campaign passed, 1 = a stage failed, 2 = fatal error, "
                           "3 = bad configuration or usage");

    // clang-format off
    arg_parser_.add_argument("config")
        .nargs(argparse::nargs_pattern::optional)
        .metavar("CONFIG")
        .action([this] (const std::string& opt) {
                opts_buffer_.config_path = opt;
        })
        .help("YAML campaign configuration file");

    // Verbatim from argparse.hpp, except replacing `-v` with `-V`
    arg_parser_.add_argument("-V", "--version")
        .default_value(false)
        .implicit_value(true)
        .nargs(0)
        .action([&](const auto & /*unused*/) {
            fmt::println(VMCHECKER_VERSION_STRING);
            std::exit(0);
        })
        .help("prints version information and exits");

    arg_parser_.add_argument("-v", "--verbose")
        .flag()
        .action([this] (const std::string& /*unused*/) {
                opts_buffer_.verbosity_delta++;

                if (opts_buffer_.verbosity_delta > ProgramOptions::MAX_VERBOSITY_DELTA) {
                    throw std::invalid_argument("Verbosity specification exceeds maximum level");
                }
            })
        .append()
        .help(fmt::format("Increase log verbosity (up to {}x)", ProgramOptions::MAX_VERBOSITY_DELTA));

    arg_parser_.add_argument("-q", "--quiet")
        .flag()
        .action([this] (const std::string& /*unused*/) {
                opts_buffer_.verbosity_delta--;

                if (opts_buffer_.verbosity_delta < ProgramOptions::MIN_VERBOSITY_DELTA) {
                    throw std::invalid_argument("Verbosity specification is lower than minimum level");
                }
            })
        .append()
        .help(fmt::format("Decrease log verbosity (up to {}x)", -ProgramOptions::MIN_VERBOSITY_DELTA));

    arg_parser_.add_argument("--example")
        .flag()
        .action([this] (const std::string& /*unused*/) {
                opts_buffer_.use_example = true;
            })
        .help("Run the built-in example configuration instead of CONFIG");

    arg_parser_.add_argument("--print-example")
        .flag()
        .action([this] (const std::string& /*unused*/) {
                opts_buffer_.print_example = true;
            })
        .help("Print the built-in example configuration and exit");

    arg_parser_.add_argument("--always-exit-zero")
        .flag()
        .action([this] (const std::string& /*unused*/) {
                opts_buffer_.always_exit_zero = true;
            })
        .help("Exit with status 0 whenever the campaign ran to an outcome, even a failing one");
    // clang-format on
}

Expected<ProgramOptions, std::string> CommandLineArgs::parse() {
    try {
        arg_parser_.parse_args(args_);
    } catch (const std::exception& err) {
        return err.what();
    }

    TRY(opts_buffer_.validate());

    LOG_DEBUG("Parsed CLI arguments: {}", opts_buffer_);

    return opts_buffer_;
}

std::string CommandLineArgs::help_message() const {
    return arg_parser_.help().str();
}

std::string CommandLineArgs::usage_message() const {
    return arg_parser_.usage();
}

std::string CommandLineArgs::get_basename(std::string_view full_name) {
    return std::string{full_name.substr(full_name.find_last_of('/') + 1)};
}

ProgramOptions parse_args_or_exit(std::span<const char*> args, int exit_code) noexcept {
    CommandLineArgs cl_args{args};
    auto opts_res = cl_args.parse();

    if (!opts_res) {
        fmt::println(stderr, "{}\n{}", styled(opts_res.error(), fg(fmt::color::red)), cl_args.usage_message());
        std::exit(exit_code);
    }

    return opts_res.value();
}

} // namespace vmchecker

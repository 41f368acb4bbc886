#pragma once

#include <vmchecker/common/formatters/debug.hpp>

#include "common/error_types.hpp"
#include "common/expected.hpp"

#include <fmt/base.h>
#include <fmt/format.h>
#include <fmt/std.h>

#include <filesystem>
#include <optional>
#include <string>

namespace vmchecker {

struct ProgramOptions
{

    // ###### Argument fields

    /// Campaign configuration file. Required unless use_example or print_example is set
    std::optional<std::filesystem::path> config_path;

    /// Run the campaign of the built-in example configuration instead of a file
    bool use_example = false;

    /// Print the built-in example configuration and exit
    bool print_example = false;

    /// Net number of -v minus -q flags. Each step moves the log level by one
    int verbosity_delta = 0;

    /// Exit with 0 on every completed run, whatever the outcome
    bool always_exit_zero = false;

    // ###### Argument limits

    static constexpr int MAX_VERBOSITY_DELTA = 2;
    static constexpr int MIN_VERBOSITY_DELTA = -4;

    static Expected<void, std::string> ensure_file_exists(const std::filesystem::path& path,
                                                          fmt::format_string<std::string> fmt) {
        if (!std::filesystem::exists(path)) {
            return (fmt::format(fmt, path.string()) + " does not exist");
        }

        return {};
    }

    static Expected<void, std::string> ensure_is_regular_file(const std::filesystem::path& path,
                                                              fmt::format_string<std::string> fmt) {
        TRY(ensure_file_exists(path, fmt));

        if (!std::filesystem::is_regular_file(path)) {
            return (fmt::format(fmt, path.string()) + " is not a regular file");
        }

        return {};
    }

    /// Verify that all fields are valid
    Expected<void, std::string> validate() const {
        if (print_example) {
            return {};
        }

        if (use_example) {
            if (config_path) {
                return std::string{"--example and a configuration file are mutually exclusive"};
            }
            return {};
        }

        if (!config_path) {
            return std::string{"No configuration file given. Pass one, or use --example to run the built-in one"};
        }

        TRY(ensure_is_regular_file(config_path.value(), "Configuration file {:?}"));

        return {};
    }
};

} // namespace vmchecker

template <>
struct fmt::formatter<::vmchecker::ProgramOptions> : ::vmchecker::DebugFormatter
{
    auto format(const ::vmchecker::ProgramOptions& from, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(),
                              "{{config={}, example={}, print_example={}, verbosity_delta={}, always_exit_zero={}}}",
                              from.config_path, from.use_example, from.print_example, from.verbosity_delta,
                              from.always_exit_zero);
    }
};

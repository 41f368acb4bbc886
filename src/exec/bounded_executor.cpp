#include "exec/bounded_executor.hpp"

#include "common/error_types.hpp"
#include "logging.hpp"
#include "vm/driver.hpp"
#include "vm/guest_session.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace vmchecker {

ExecResult::ExecResult(Kind kind, std::optional<int> exit_code, std::string reason)
    : kind_{kind}
    , exit_code_{exit_code}
    , reason_{std::move(reason)} {}

ExecResult ExecResult::make_completed(int exit_code) {
    return ExecResult{Kind::Completed, exit_code, ""};
}

ExecResult ExecResult::make_timed_out(std::string reason) {
    return ExecResult{Kind::TimedOut, std::nullopt, std::move(reason)};
}

BoundedExecutor::BoundedExecutor(const GuestSession& session)
    : session_{&session} {}

std::string BoundedExecutor::make_executable_command(std::string_view script_shell_path) {
    return fmt::format("chmod +x {0}; {0}", script_shell_path);
}

std::string BoundedExecutor::login_shell_arguments(std::string_view command) {
    std::string quoted;
    quoted.reserve(command.size() + 2);

    quoted += '"';
    for (char chr : command) {
        if (chr == '"' || chr == '\\') {
            quoted += '\\';
        }
        quoted += chr;
    }
    quoted += '"';

    return fmt::format("--login -c {}", quoted);
}

ExecResult BoundedExecutor::run_script(const std::string& shell_path, const std::string& script_shell_path,
                                       std::chrono::milliseconds timeout) const {
    return run_with_timeout(shell_path, make_executable_command(script_shell_path), timeout);
}

ExecResult BoundedExecutor::run_with_timeout(const std::string& shell_path, const std::string& command_line,
                                             std::chrono::milliseconds timeout) const {
    LOG_INFO("Running {:?} in guest (timeout {})", command_line, timeout);

    try {
        // Everything the worker touches is owned by the worker; it may outlive this call, the session and
        // the campaign
        std::packaged_task<Result<int>()> task{
            [driver = session_->shared_driver(), shell_path, args = login_shell_arguments(command_line)] {
                return driver->run_program_in_guest(shell_path, args);
            }};

        std::future<Result<int>> result = task.get_future();

        std::thread{std::move(task)}.detach();

        if (result.wait_for(timeout) != std::future_status::ready) {
            LOG_WARN("{:?} did not return within {}; abandoning its worker", command_line, timeout);
            return ExecResult::make_timed_out(fmt::format("no result within {}", timeout));
        }

        Result<int> exit_code = result.get();

        if (!exit_code) {
            LOG_WARN("Could not run {:?} in guest: {}", command_line, exit_code.error());
            return ExecResult::make_timed_out(fmt::format("driver error: {}", exit_code.error()));
        }

        LOG_INFO("{:?} exited with code {}", command_line, *exit_code);

        return ExecResult::make_completed(*exit_code);
    } catch (const std::exception& ex) {
        LOG_WARN("Exception while running {:?} in guest: {}", command_line, ex.what());
        return ExecResult::make_timed_out(fmt::format("exception: {}", ex.what()));
    } catch (...) {
        LOG_WARN("Unknown exception while running {:?} in guest", command_line);
        return ExecResult::make_timed_out("unknown exception");
    }
}

} // namespace vmchecker

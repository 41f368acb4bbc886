#pragma once

#include <vmchecker/common/formatters/enum.hpp>
#include <vmchecker/vm/guest_session.hpp>

#include <boost/describe/enum.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace vmchecker {

/// Outcome of one bounded remote call
class ExecResult
{
public:
    enum class Kind { Completed, TimedOut };
    BOOST_DESCRIBE_NESTED_ENUM(Kind, Completed, TimedOut);

    static ExecResult make_completed(int exit_code);
    static ExecResult make_timed_out(std::string reason);

    Kind get_kind() const { return kind_; }
    bool completed() const { return kind_ == Kind::Completed; }

    /// Only present for Kind::Completed
    std::optional<int> get_exit_code() const { return exit_code_; }

    /// Why the call is considered timed out (expired wait, driver error, exception)
    const std::string& get_reason() const { return reason_; }

private:
    ExecResult(Kind kind, std::optional<int> exit_code, std::string reason);

    Kind kind_;
    std::optional<int> exit_code_;
    std::string reason_;
};

/// Issues remote shell commands in the guest and waits for them for a bounded amount of time.
///
/// Each call is made from its own detached worker thread. When the timeout expires the executor
/// stops waiting, but nothing stops the worker or the guest process: the remote side effect may
/// still be in progress, and the worker lives on until the driver call returns (possibly never).
/// The worker holds shared ownership of the driver, so it may safely outlive the session.
///
/// Any failure to issue or await the call is reported as TimedOut, so callers abort.
class BoundedExecutor
{
public:
    explicit BoundedExecutor(const GuestSession& session);

    /// Runs ``command_line`` through ``shell_path`` as a login shell (``--login -c``)
    ExecResult run_with_timeout(const std::string& shell_path, const std::string& command_line,
                                std::chrono::milliseconds timeout) const;

    /// Grants execute permission to the guest script at ``script_shell_path`` then runs it, as one
    /// shell invocation
    ExecResult run_script(const std::string& shell_path, const std::string& script_shell_path,
                          std::chrono::milliseconds timeout) const;

    /// "chmod +x <script>; <script>"
    static std::string make_executable_command(std::string_view script_shell_path);

    /// Arguments that make a shell run ``command`` as a login shell, with ``command`` quoted as one word
    static std::string login_shell_arguments(std::string_view command);

private:
    const GuestSession* session_;
};

} // namespace vmchecker

FMT_SERIALIZE_ENUM(::vmchecker::ExecResult::Kind);

#pragma once

#include <vmchecker/common/class_traits.hpp>
#include <vmchecker/common/error_types.hpp>
#include <vmchecker/common/linux.hpp>

#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace vmchecker {

/// Exit status and combined stdout/stderr of a finished host process
struct ProcessOutput
{
    int exit_code;
    std::string output;
};

/// A host child process running ``exec`` with ``args``, with stdout and stderr captured through one pipe.
/// ``exec`` is looked up in PATH if it contains no slash. ENV variables are inherited.
///
/// Safe to use from several threads at once, as long as each thread owns its own Subprocess.
class Subprocess : NonCopyable
{
public:
    Subprocess(std::string exec, std::vector<std::string> args);
    ~Subprocess();

    Subprocess(Subprocess&& other) noexcept;
    Subprocess& operator=(Subprocess&& rhs) noexcept;

    Result<void> start();

    /// Blocking. Reads all output until the child closes its end of the pipe, then reaps it.
    /// Returns the exit code; a child killed by signal N reports 128 + N, and one that could
    /// not be executed reports 127.
    Result<int> wait_for_exit();

    /// Kills the child with SIGKILL and reaps it
    Result<void> kill();

    const std::string& get_output() const { return output_; }

    std::optional<int> get_exit_code() const { return exit_code_; }

    pid_t get_pid() const { return child_pid_; }

    /// start() + wait_for_exit()
    static Result<ProcessOutput> run(std::string exec, std::vector<std::string> args);

    /// Exit status reported for a child that failed to exec
    static constexpr int EXEC_FAILURE_CODE = 127;

private:
    /// Kills and reaps a running child and closes the pipe, leaving this object as if moved from
    void release() noexcept;

    Result<void> drain_output();
    Result<void> close_pipe();
    Result<int> reap();

    std::string exec_;
    std::vector<std::string> args_;

    pid_t child_pid_{};
    linux::Pipe output_pipe_{.read_fd = -1, .write_fd = -1};

    std::string output_;
    std::optional<int> exit_code_;
};

} // namespace vmchecker

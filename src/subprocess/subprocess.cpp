#include "subprocess/subprocess.hpp"

#include "common/error_types.hpp"
#include "common/expected.hpp"
#include "common/linux.hpp"
#include "logging.hpp"

#include <fmt/ranges.h>
#include <libassert/assert.hpp>

#include <csignal>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace vmchecker {

namespace {

constexpr std::size_t READ_CHUNK_SIZE = 4096;

int decode_wait_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

} // namespace

Subprocess::Subprocess(std::string exec, std::vector<std::string> args)
    : exec_{std::move(exec)}
    , args_{std::move(args)} {}

Subprocess::~Subprocess() {
    release();
}

Subprocess::Subprocess(Subprocess&& other) noexcept
    : exec_{std::move(other.exec_)}
    , args_{std::move(other.args_)}
    , child_pid_{std::exchange(other.child_pid_, 0)}
    , output_pipe_{std::exchange(other.output_pipe_, {.read_fd = -1, .write_fd = -1})}
    , output_{std::move(other.output_)}
    , exit_code_{std::exchange(other.exit_code_, std::nullopt)} {}

Subprocess& Subprocess::operator=(Subprocess&& rhs) noexcept {
    if (this == &rhs) {
        return *this;
    }

    release();

    exec_ = std::move(rhs.exec_);
    args_ = std::move(rhs.args_);
    child_pid_ = std::exchange(rhs.child_pid_, 0);
    output_pipe_ = std::exchange(rhs.output_pipe_, {.read_fd = -1, .write_fd = -1});
    output_ = std::move(rhs.output_);
    exit_code_ = std::exchange(rhs.exit_code_, std::nullopt);

    return *this;
}

void Subprocess::release() noexcept {
    // if child_pid_ == 0, then the child was never started, or the object was moved from
    if (child_pid_ == 0 || exit_code_) {
        std::ignore = close_pipe();
    } else if (auto res = kill(); !res) {
        LOG_WARN("Failed to kill subprocess {} ({}): {}", child_pid_, exec_, res.error());
    }

    child_pid_ = 0;
    output_pipe_ = {.read_fd = -1, .write_fd = -1};
}

Result<void> Subprocess::start() {
    DEBUG_ASSERT(child_pid_ == 0, "Subprocess started twice", exec_);

    LOG_TRACE("Starting subprocess {} {}", exec_, args_);

    output_pipe_ = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);

    // Built before forking; the child may only make async-signal-safe calls
    std::vector<char*> argv = linux::make_argv(exec_, args_);

    linux::Fork forked = TRYE(linux::fork(), SyscallFailure);

    if (forked.which == linux::Fork::Child) {
        // O_CLOEXEC is cleared on the duplicates, so both stdout and stderr survive exec
        if (::dup2(output_pipe_.write_fd, STDOUT_FILENO) == -1 || ::dup2(output_pipe_.write_fd, STDERR_FILENO) == -1) {
            ::_exit(EXEC_FAILURE_CODE);
        }

        ::execvp(argv.front(), argv.data());

        ::_exit(EXEC_FAILURE_CODE);
    }

    child_pid_ = forked.pid;

    // The parent only reads; closing our write end lets reads see EOF once the child exits
    TRYE(linux::close(output_pipe_.write_fd), SyscallFailure);
    output_pipe_.write_fd = -1;

    return {};
}

Result<int> Subprocess::wait_for_exit() {
    DEBUG_ASSERT(child_pid_ != 0, "wait_for_exit called on a subprocess that was never started", exec_);

    if (exit_code_) {
        return exit_code_.value();
    }

    TRY(drain_output());
    TRY(close_pipe());

    return reap();
}

Result<void> Subprocess::kill() {
    if (child_pid_ == 0 || exit_code_) {
        return {};
    }

    TRY(close_pipe());
    TRYE(linux::kill(child_pid_, SIGKILL), SyscallFailure);

    TRY(reap());

    return {};
}

Result<ProcessOutput> Subprocess::run(std::string exec, std::vector<std::string> args) {
    Subprocess proc{std::move(exec), std::move(args)};

    TRY(proc.start());
    int exit_code = TRY(proc.wait_for_exit());

    return ProcessOutput{.exit_code = exit_code, .output = std::move(proc.output_)};
}

Result<void> Subprocess::drain_output() {
    if (output_pipe_.read_fd == -1) {
        return {};
    }

    while (true) {
        std::string chunk = TRYE(linux::read(output_pipe_.read_fd, READ_CHUNK_SIZE), SyscallFailure);

        // EOF
        if (chunk.empty()) {
            return {};
        }

        output_ += chunk;
    }
}

Result<void> Subprocess::close_pipe() {
    if (output_pipe_.read_fd != -1) {
        TRYE(linux::close(output_pipe_.read_fd), SyscallFailure);
        output_pipe_.read_fd = -1;
    }
    if (output_pipe_.write_fd != -1) {
        TRYE(linux::close(output_pipe_.write_fd), SyscallFailure);
        output_pipe_.write_fd = -1;
    }

    return {};
}

Result<int> Subprocess::reap() {
    int status = TRYE(linux::waitpid(child_pid_), SyscallFailure);

    exit_code_ = decode_wait_status(status);

    LOG_TRACE("Subprocess {} ({}) exited with code {}", child_pid_, exec_, exit_code_.value());

    return exit_code_.value();
}

} // namespace vmchecker

#include "catch2_custom.hpp"

#include "common/error_types.hpp"
#include "subprocess/subprocess.hpp"

#include <cerrno>
#include <csignal>
#include <string>
#include <utility>

#include <sys/types.h>

using vmchecker::Subprocess;

TEST_CASE("Read /bin/echo stdout") {
    Subprocess proc("/bin/echo", {"-n", "Hello", "world!"});
    REQUIRE(proc.start());

    REQUIRE(proc.wait_for_exit() == 0);

    REQUIRE(proc.get_output() == "Hello world!");
    REQUIRE(proc.get_exit_code() == 0);
}

TEST_CASE("stdout and stderr are captured together, with the exit code") {
    auto res = Subprocess::run("/bin/sh", {"-c", "echo out; echo err >&2; exit 7"});

    REQUIRE(res);
    REQUIRE(res.value().exit_code == 7);
    REQUIRE_THAT(res.value().output, Catch::Matchers::ContainsSubstring("out\n"));
    REQUIRE_THAT(res.value().output, Catch::Matchers::ContainsSubstring("err\n"));
}

TEST_CASE("Executables are looked up in PATH") {
    auto res = Subprocess::run("sh", {"-c", "printf found"});

    REQUIRE(res);
    REQUIRE(res.value().output == "found");
}

TEST_CASE("A missing executable exits with the exec failure code") {
    auto res = Subprocess::run("/this/does/not/exist", {});

    REQUIRE(res);
    REQUIRE(res.value().exit_code == Subprocess::EXEC_FAILURE_CODE);
}

TEST_CASE("Killing a running process reaps it") {
    Subprocess proc("/bin/sleep", {"30"});
    REQUIRE(proc.start());

    REQUIRE(proc.kill());
    REQUIRE(proc.get_exit_code() == 128 + 9);

    // Already reaped; waiting again just reports the same code
    REQUIRE(proc.wait_for_exit() == 128 + 9);
}

TEST_CASE("Moved-from subprocesses are inert") {
    Subprocess proc("/bin/echo", {"moved"});
    REQUIRE(proc.start());

    Subprocess other = std::move(proc);
    REQUIRE(proc.get_pid() == 0); // NOLINT(bugprone-use-after-move)

    REQUIRE(other.wait_for_exit() == 0);
    REQUIRE(other.get_output() == "moved\n");
}

TEST_CASE("Assigning over a running subprocess kills and reaps it") {
    Subprocess proc("/bin/sleep", {"30"});
    REQUIRE(proc.start());
    const pid_t sleeper = proc.get_pid();

    Subprocess replacement("/bin/echo", {"replaced"});
    REQUIRE(replacement.start());

    proc = std::move(replacement);

    // Reaped, so the pid no longer names any process
    REQUIRE(::kill(sleeper, 0) == -1);
    REQUIRE(errno == ESRCH);

    REQUIRE(proc.wait_for_exit() == 0);
    REQUIRE(proc.get_output() == "replaced\n");
}

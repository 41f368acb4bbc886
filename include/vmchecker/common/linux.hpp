#pragma once

#include <vmchecker/common/expected.hpp>
#include <vmchecker/logging.hpp>

#include <libassert/assert.hpp>
#include <range/v3/algorithm/transform.hpp>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>
#include <vector>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace vmchecker::linux {

inline std::error_code make_error_code(int err = errno) {
    return {err, std::generic_category()};
}

/// reads from a file descriptor, retrying on EINTR. See read(2)
/// returns success/failure; logs failure at debug level
inline Expected<std::string> read(int fd, size_t count) { // NOLINT
    std::string buffer(count, '\0');

    ssize_t res = -1;
    do {
        res = ::read(fd, buffer.data(), count);
    } while (res == -1 && errno == EINTR);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("read failed: '{}'", err.message());
        return err;
    }

    DEBUG_ASSERT(res >= 0, "read result is negative and != -1");
    buffer.resize(static_cast<std::size_t>(res));

    return buffer;
}

/// closes a file descriptor. See close(2)
/// returns success/failure; logs failure at debug level
inline Expected<> close(int fd) {
    int res = ::close(fd);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("close failed: '{}'", err.message());
        return err;
    }

    return {};
}

/// see kill(2)
/// returns success/failure; logs failure at debug level
inline Expected<> kill(pid_t pid, int sig) {
    int res = ::kill(pid, sig);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("kill failed: '{}'", err.message());
        return err;
    }

    return {};
}

/// Argument vector in the form execvp(3) expects: exec, args..., NULL
/// Must be built before forking; the child may not allocate
inline std::vector<char*> make_argv(const std::string& exec, const std::vector<std::string>& args) {
    // Reason: execvp requires non-const strings
    // NOLINTBEGIN(cppcoreguidelines-pro-type-const-cast)
    std::vector<char*> cstr_arg_list(args.size() + 2, nullptr);

    auto to_cstr = [](const std::string& str) { return const_cast<char*>(str.c_str()); };

    cstr_arg_list.front() = const_cast<char*>(exec.c_str());
    ranges::transform(args, cstr_arg_list.begin() + 1, to_cstr);
    // NOLINTEND(cppcoreguidelines-pro-type-const-cast)

    return cstr_arg_list;
}

struct Fork
{
    enum { Parent, Child } which;

    pid_t pid; // Only valid if which == Parent
};

/// see fork(2)
/// returns result from enum; logs failure at debug level
inline Expected<Fork> fork() {
    pid_t res = ::fork();

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("fork failed: '{}'", err.message());
        return err;
    }

    if (res == 0) {
        return Fork{.which = Fork::Child, .pid = 0};
    }

    return Fork{.which = Fork::Parent, .pid = res};
}

/// see waitpid(2), retrying on EINTR
/// returns the raw wait status; logs failure at debug level
inline Expected<int> waitpid(pid_t pid, int options = 0) {
    int status = 0;
    pid_t res = -1;

    do {
        res = ::waitpid(pid, &status, options);
    } while (res == -1 && errno == EINTR);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("waitpid failed: '{}'", err.message());

        return err;
    }

    return status;
}

struct Pipe
{
    int read_fd;
    int write_fd;
};

// Ensure that fds are packed so that pipe works properly
static_assert(offsetof(Pipe, read_fd) + sizeof(Pipe::read_fd) == offsetof(Pipe, write_fd));

/// see pipe2(2)
/// returns success/failure; logs failure at debug level
inline Expected<Pipe> pipe2(int flags = 0) {
    Pipe pipe{};

    int res = ::pipe2(&pipe.read_fd, flags);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("pipe failed: '{}'", err.message());

        return err;
    }

    return pipe;
}

/// Creates a UDP socket bound to ``port`` on all IPv4 interfaces. See socket(2) and bind(2)
/// returns the socket fd; logs failure at debug level
inline Expected<int> bind_udp(std::uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);

    if (fd == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("socket failed: '{}'", err.message());

        return err;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(INADDR_ANY);

    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    if (::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("bind to port {} failed: '{}'", port, err.message());
        ::close(fd);

        return err;
    }

    return fd;
}

/// Port a bound IPv4 socket is listening on. See getsockname(2)
/// returns success/failure; logs failure at debug level
inline Expected<std::uint16_t> bound_port(int fd) {
    sockaddr_in addr{};
    socklen_t addr_len = sizeof(addr);

    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &addr_len) == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("getsockname failed: '{}'", err.message());

        return err;
    }

    return ntohs(addr.sin_port);
}

/// Waits for ``fd`` to become readable. See poll(2)
/// returns whether data is available before ``timeout_ms`` expired; logs failure at debug level
inline Expected<bool> poll_readable(int fd, int timeout_ms) {
    struct pollfd poll_struct = {.fd = fd, .events = POLLIN, .revents = 0};

    int res = ::poll(&poll_struct, 1, timeout_ms);

    if (res == -1) {
        if (errno == EINTR) {
            return false;
        }

        auto err = make_error_code(errno);

        LOG_DEBUG("poll failed: '{}'", err.message());

        return err;
    }

    return res > 0 && (poll_struct.revents & POLLIN) != 0;
}

/// Receives one datagram of at most ``max_size`` bytes. See recv(2)
/// returns success/failure; logs failure at debug level
inline Expected<std::string> recv(int fd, std::size_t max_size) {
    std::string buffer(max_size, '\0');

    ssize_t res = ::recv(fd, buffer.data(), buffer.size(), 0);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("recv failed: '{}'", err.message());

        return err;
    }

    buffer.resize(static_cast<std::size_t>(res));

    return buffer;
}

} // namespace vmchecker::linux

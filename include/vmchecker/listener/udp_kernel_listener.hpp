#pragma once

#include <vmchecker/campaign/kernel_listener.hpp>
#include <vmchecker/common/class_traits.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <thread>

namespace vmchecker {

/// Receives the guest's netconsole output over UDP and appends every datagram, verbatim, to a log file.
///
/// start() binds the port and spawns one receive thread; stop() (or destruction) signals the thread,
/// joins it, and closes the socket. Calling either one twice in a row has no effect.
class UdpKernelListener : public KernelListener, NonMovable
{
public:
    /// A ``port`` of 0 binds an ephemeral port, see get_bound_port()
    UdpKernelListener(std::uint16_t port, std::filesystem::path log_path);
    ~UdpKernelListener() override;

    void start() override;
    void stop() override;

    bool is_running() const { return running_; }

    /// Port actually bound while running
    std::optional<std::uint16_t> get_bound_port() const { return bound_port_; }

    static constexpr std::chrono::milliseconds POLL_INTERVAL{100};
    static constexpr std::size_t MAX_DATAGRAM_SIZE = 65507;

private:
    void receive_loop();

    std::uint16_t port_;
    std::filesystem::path log_path_;

    int socket_fd_ = -1;
    std::optional<std::uint16_t> bound_port_;
    std::ofstream log_file_;

    std::atomic<bool> running_{false};
    std::thread thread_;
};

} // namespace vmchecker

#include "listener/udp_kernel_listener.hpp"

#include "common/linux.hpp"
#include "logging.hpp"

#include <fmt/format.h>
#include <fmt/std.h>
#include <gsl/narrow>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <ios>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

namespace vmchecker {

UdpKernelListener::UdpKernelListener(std::uint16_t port, std::filesystem::path log_path)
    : port_{port}
    , log_path_{std::move(log_path)} {}

UdpKernelListener::~UdpKernelListener() {
    stop();
}

void UdpKernelListener::start() {
    if (running_) {
        LOG_DEBUG("Kernel listener already running on port {}", bound_port_.value_or(port_));
        return;
    }

    if (log_path_.has_parent_path()) {
        std::error_code err;
        std::filesystem::create_directories(log_path_.parent_path(), err);
        if (err) {
            LOG_ERROR("Could not create directory for kernel log {}: {}", log_path_, err.message());
            return;
        }
    }

    log_file_.open(log_path_, std::ios::out | std::ios::app | std::ios::binary);
    if (!log_file_.is_open()) {
        LOG_ERROR("Could not open kernel log {} for appending", log_path_);
        return;
    }

    auto socket_fd = linux::bind_udp(port_);
    if (!socket_fd) {
        LOG_ERROR("Kernel listener could not bind UDP port {}: {}", port_, socket_fd.error().message());
        log_file_.close();
        return;
    }
    socket_fd_ = socket_fd.value();

    if (auto bound = linux::bound_port(socket_fd_)) {
        bound_port_ = bound.value();
    } else {
        bound_port_ = port_;
    }

    LOG_INFO("Kernel listener receiving on UDP port {}, logging to {}", bound_port_.value(), log_path_);

    running_ = true;
    thread_ = std::thread{[this] { receive_loop(); }};
}

void UdpKernelListener::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    if (thread_.joinable()) {
        thread_.join();
    }

    if (auto res = linux::close(socket_fd_); !res) {
        LOG_WARN("Failed to close kernel listener socket: {}", res.error().message());
    }
    socket_fd_ = -1;
    bound_port_.reset();

    log_file_.flush();
    log_file_.close();

    LOG_INFO("Kernel listener stopped");
}

void UdpKernelListener::receive_loop() {
    const int poll_ms = gsl::narrow<int>(POLL_INTERVAL.count());

    while (running_) {
        auto readable = linux::poll_readable(socket_fd_, poll_ms);

        if (!readable) {
            LOG_ERROR("Kernel listener stopped receiving: {}", readable.error().message());
            return;
        }

        if (!readable.value()) {
            continue;
        }

        auto datagram = linux::recv(socket_fd_, MAX_DATAGRAM_SIZE);
        if (!datagram) {
            LOG_WARN("Dropped a kernel message: {}", datagram.error().message());
            continue;
        }

        log_file_ << datagram.value();
        log_file_.flush();

        if (!log_file_) {
            LOG_ERROR("Failed writing to kernel log {}", log_path_);
            return;
        }
    }
}

} // namespace vmchecker

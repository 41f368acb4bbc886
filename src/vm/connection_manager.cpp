#include "vm/connection_manager.hpp"

#include "exceptions.hpp"
#include "logging.hpp"

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <memory>
#include <string>
#include <utility>

namespace vmchecker {

VmHandle::VmHandle(std::shared_ptr<VirtualizationDriver> driver, std::string vm_identifier)
    : driver_{std::move(driver)}
    , identifier_{std::move(vm_identifier)} {}

VmHandle::~VmHandle() {
    close();
}

VmHandle::VmHandle(VmHandle&& other) noexcept
    : driver_{std::exchange(other.driver_, nullptr)}
    , identifier_{std::move(other.identifier_)} {}

VmHandle& VmHandle::operator=(VmHandle&& rhs) noexcept {
    if (this != &rhs) {
        close();
        driver_ = std::exchange(rhs.driver_, nullptr);
        identifier_ = std::move(rhs.identifier_);
    }

    return *this;
}

VirtualizationDriver& VmHandle::driver() const {
    ASSERT(driver_ != nullptr, "Attempt to use a VmHandle after teardown", identifier_);
    return *driver_;
}

std::shared_ptr<VirtualizationDriver> VmHandle::shared_driver() const {
    ASSERT(driver_ != nullptr, "Attempt to use a VmHandle after teardown", identifier_);
    return driver_;
}

void VmHandle::close() noexcept {
    if (driver_ == nullptr) {
        return;
    }

    LOG_DEBUG("Closing VM {:?}", identifier_);

    driver_->close_vm();
    driver_->disconnect_host();
    driver_.reset();
}

ConnectionManager::ConnectionManager(std::shared_ptr<VirtualizationDriver> driver)
    : driver_{std::move(driver)} {
    ASSERT(driver_ != nullptr);
}

VmHandle ConnectionManager::open(const std::string& vm_identifier) const {
    LOG_DEBUG("Connecting to virtualization host");

    if (auto res = driver_->connect_host(); !res) {
        throw ConnectionError(res.error(), "Could not connect to the virtualization host");
    }

    LOG_DEBUG("Opening VM {:?}", vm_identifier);

    if (auto res = driver_->open_vm(vm_identifier); !res) {
        driver_->disconnect_host();
        throw ConnectionError(res.error(), fmt::format("Could not open VM {:?}", vm_identifier));
    }

    LOG_INFO("Opened VM {:?}", vm_identifier);

    return VmHandle{driver_, vm_identifier};
}

} // namespace vmchecker

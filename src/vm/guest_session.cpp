#include "vm/guest_session.hpp"

#include "exceptions.hpp"
#include "logging.hpp"
#include "vm/connection_manager.hpp"
#include "vm/driver.hpp"

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <memory>
#include <utility>

namespace vmchecker {

GuestSession GuestSession::establish(const VmHandle& vm, GuestCredentials credentials) {
    auto driver = vm.shared_driver();

    LOG_INFO("Waiting for guest tools in VM {:?}", vm.identifier());

    if (auto res = DEBUG_TIME(driver->wait_for_tools()); !res) {
        throw GuestLoginError(res.error(), "Guest tools did not become ready");
    }

    LOG_DEBUG("Logging into guest as {:?}", credentials.username);

    if (auto res = driver->login_in_guest(credentials); !res) {
        throw GuestLoginError(res.error(), fmt::format("Guest rejected login for user {:?}", credentials.username));
    }

    LOG_INFO("Logged into guest as {:?}", credentials.username);

    return GuestSession{std::move(driver), std::move(credentials)};
}

GuestSession::GuestSession(std::shared_ptr<VirtualizationDriver> driver, GuestCredentials credentials)
    : driver_{std::move(driver)}
    , credentials_{std::move(credentials)} {}

GuestSession::~GuestSession() {
    logout();
}

GuestSession::GuestSession(GuestSession&& other) noexcept
    : driver_{std::exchange(other.driver_, nullptr)}
    , credentials_{std::move(other.credentials_)} {}

GuestSession& GuestSession::operator=(GuestSession&& rhs) noexcept {
    if (this != &rhs) {
        logout();
        driver_ = std::exchange(rhs.driver_, nullptr);
        credentials_ = std::move(rhs.credentials_);
    }

    return *this;
}

VirtualizationDriver& GuestSession::driver() const {
    ASSERT(driver_ != nullptr, "Attempt to use a GuestSession after logout");
    return *driver_;
}

std::shared_ptr<VirtualizationDriver> GuestSession::shared_driver() const {
    ASSERT(driver_ != nullptr, "Attempt to use a GuestSession after logout");
    return driver_;
}

void GuestSession::logout() noexcept {
    if (driver_ == nullptr) {
        return;
    }

    LOG_DEBUG("Logging out of guest user {:?}", credentials_.username);

    driver_->logout_from_guest();
    driver_.reset();
}

} // namespace vmchecker

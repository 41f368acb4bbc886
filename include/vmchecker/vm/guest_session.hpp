#pragma once

#include <vmchecker/common/class_traits.hpp>
#include <vmchecker/vm/connection_manager.hpp>
#include <vmchecker/vm/driver.hpp>

#include <memory>
#include <string>

namespace vmchecker {

/// An authenticated login into the guest OS. Logs out on destruction.
class GuestSession : NonCopyable
{
public:
    /// Waits for guest tooling to become ready (with no upper bound other than the driver's own),
    /// then logs in with ``credentials``
    ///
    /// \throws GuestLoginError if the tools never become ready or the credentials are rejected
    static GuestSession establish(const VmHandle& vm, GuestCredentials credentials);

    ~GuestSession();

    GuestSession(GuestSession&& other) noexcept;
    GuestSession& operator=(GuestSession&& rhs) noexcept;

    VirtualizationDriver& driver() const;

    /// Shared ownership of the driver, for remote calls that may outlive the session
    std::shared_ptr<VirtualizationDriver> shared_driver() const;

    const std::string& username() const { return credentials_.username; }

    bool is_logged_in() const { return driver_ != nullptr; }

    /// Idempotent
    void logout() noexcept;

private:
    GuestSession(std::shared_ptr<VirtualizationDriver> driver, GuestCredentials credentials);

    std::shared_ptr<VirtualizationDriver> driver_;
    GuestCredentials credentials_;
};

} // namespace vmchecker

#pragma once

#include <vmchecker/common/class_traits.hpp>
#include <vmchecker/vm/driver.hpp>

#include <memory>
#include <string>

namespace vmchecker {

/// Exclusive ownership of an opened host+VM pair for the duration of one campaign.
/// The VM is closed and the host disconnected when the handle is destroyed; a moved-from
/// or closed handle is unusable.
class VmHandle : NonCopyable
{
public:
    VmHandle(std::shared_ptr<VirtualizationDriver> driver, std::string vm_identifier);
    ~VmHandle();

    VmHandle(VmHandle&& other) noexcept;
    VmHandle& operator=(VmHandle&& rhs) noexcept;

    VirtualizationDriver& driver() const;

    /// Shared ownership of the driver, for work that may outlive this handle
    std::shared_ptr<VirtualizationDriver> shared_driver() const;

    const std::string& identifier() const { return identifier_; }

    bool is_open() const { return driver_ != nullptr; }

    /// Close the VM and disconnect from the host. Idempotent
    void close() noexcept;

private:
    std::shared_ptr<VirtualizationDriver> driver_;
    std::string identifier_;
};

/// Opens a VmHandle through a virtualization driver. A single attempt is made; there is no retry
class ConnectionManager
{
public:
    explicit ConnectionManager(std::shared_ptr<VirtualizationDriver> driver);

    /// \throws ConnectionError if the host cannot be reached or the VM cannot be located/opened
    VmHandle open(const std::string& vm_identifier) const;

private:
    std::shared_ptr<VirtualizationDriver> driver_;
};

} // namespace vmchecker

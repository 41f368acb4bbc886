#pragma once

#include <vmchecker/common/error_types.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace vmchecker {

/// Immutable username/password pair used to log into the guest OS
struct GuestCredentials
{
    std::string username;
    std::string password;
};

/// Primitive operations on one virtual machine, provided by a virtualization backend.
///
/// One driver instance controls at most one VM at a time. Every primitive reports failure through
/// its Result; none of them are expected to throw.
///
/// run_program_in_guest may still be executing on a detached worker thread (see BoundedExecutor)
/// while other primitives are called from the campaign thread, so implementations must tolerate
/// that call overlapping with any other.
class VirtualizationDriver
{
public:
    virtual ~VirtualizationDriver() = default;

    virtual Result<void> connect_host() = 0;
    virtual void disconnect_host() = 0;

    /// Locate and open the VM named by ``vm_identifier`` (e.g. a .vmx path)
    virtual Result<void> open_vm(const std::string& vm_identifier) = 0;
    virtual void close_vm() = 0;

    /// Names of the VM's root snapshots, oldest first
    virtual Result<std::vector<std::string>> list_root_snapshots() = 0;
    virtual Result<void> revert_to_snapshot(const std::string& snapshot_name) = 0;

    /// Blocks until guest tooling is ready. No upper bound other than what the backend imposes
    virtual Result<void> wait_for_tools() = 0;

    virtual Result<void> login_in_guest(const GuestCredentials& credentials) = 0;
    virtual void logout_from_guest() = 0;

    /// ErrorKind::FileNotFound is reported when the source file does not exist
    virtual Result<void> copy_file_host_to_guest(const std::filesystem::path& host_path,
                                                 const std::string& guest_path) = 0;
    /// ErrorKind::FileNotFound is reported when the source file does not exist
    virtual Result<void> copy_file_guest_to_host(const std::string& guest_path,
                                                 const std::filesystem::path& host_path) = 0;

    /// Runs ``program`` with ``command_line`` in the guest and blocks until it exits
    /// \returns the guest program's exit code
    virtual Result<int> run_program_in_guest(const std::string& program, const std::string& command_line) = 0;
};

} // namespace vmchecker

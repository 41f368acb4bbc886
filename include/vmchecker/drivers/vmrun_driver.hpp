#pragma once

#include <vmchecker/common/error_types.hpp>
#include <vmchecker/subprocess/subprocess.hpp>
#include <vmchecker/vm/driver.hpp>

#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vmchecker {

/// VirtualizationDriver backed by VMware's ``vmrun`` command line tool.
///
/// Every primitive is a separate ``vmrun -T <host_type> ...`` invocation; vmrun itself keeps no
/// session, so "connecting" and "logging in" only validate state and remember it for later calls.
/// Guest credentials are passed with -gu/-gp on every guest operation.
class VmrunDriver : public VirtualizationDriver
{
public:
    VmrunDriver(std::string vmrun_path, std::string host_type);

    Result<void> connect_host() override;
    void disconnect_host() override;

    Result<void> open_vm(const std::string& vm_identifier) override;
    void close_vm() override;

    Result<std::vector<std::string>> list_root_snapshots() override;
    Result<void> revert_to_snapshot(const std::string& snapshot_name) override;

    Result<void> wait_for_tools() override;

    Result<void> login_in_guest(const GuestCredentials& credentials) override;
    void logout_from_guest() override;

    Result<void> copy_file_host_to_guest(const std::filesystem::path& host_path,
                                         const std::string& guest_path) override;
    Result<void> copy_file_guest_to_host(const std::string& guest_path,
                                         const std::filesystem::path& host_path) override;

    Result<int> run_program_in_guest(const std::string& program, const std::string& command_line) override;

    /// Parses ``listSnapshots <vmx> showTree`` output into the names of the root snapshots, in order.
    /// Child snapshots are indented and skipped.
    static Expected<std::vector<std::string>, std::string> parse_snapshot_list(std::string_view output);

    /// Guest exit code from a ``runProgramInGuest`` invocation, given vmrun's own exit status and output.
    /// Returns nullopt if the program never ran in the guest.
    static std::optional<int> parse_guest_exit_code(int vmrun_exit_code, std::string_view output);

    /// Maps a vmrun error message ("Error: ...") to the closest ErrorKind
    static ErrorKind classify_error(std::string_view output, ErrorKind fallback = ErrorKind::UnknownError);

    static constexpr std::chrono::seconds TOOLS_POLL_INTERVAL{1};

private:
    enum class NeedsGuest { No, Yes };

    std::vector<std::string> make_args(std::string_view command, NeedsGuest needs_guest,
                                       const std::vector<std::string>& rest) const;

    /// Runs vmrun; a non-zero vmrun exit status is reported as classify_error(output, ``fallback``)
    Result<std::string> vmrun(std::string_view command, NeedsGuest needs_guest, const std::vector<std::string>& rest,
                              ErrorKind fallback) const;

    std::string vmx_path() const;

    std::string vmrun_path_;
    std::string host_type_;

    /// Guards the state below; run_program_in_guest may be called from a worker thread
    mutable std::mutex mutex_;
    std::optional<std::string> vmx_path_;
    std::optional<GuestCredentials> credentials_;
};

} // namespace vmchecker

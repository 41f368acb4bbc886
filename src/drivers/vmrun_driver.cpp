#include "drivers/vmrun_driver.hpp"

#include "common/error_types.hpp"
#include "common/expected.hpp"
#include "logging.hpp"
#include "subprocess/subprocess.hpp"
#include "vm/driver.hpp"

#include <fmt/format.h>
#include <fmt/std.h>
#include <range/v3/algorithm/transform.hpp>
#include <range/v3/view/drop.hpp>

#include <cctype>
#include <charconv>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace vmchecker {

namespace {

/// Upper bound on wait_for_tools; vmrun's checkToolsState returns immediately, so polling is ours to bound
constexpr std::chrono::minutes TOOLS_WAIT_LIMIT{10};

struct ErrorPattern
{
    std::string_view needle;
    ErrorKind kind;
};

// Matched in order against the lower-cased output. vmrun's messages are not versioned, so these are loose
constexpr ErrorPattern ERROR_PATTERNS[] = {
    {"invalid user name or password", ErrorKind::AuthenticationRejected},
    {"authentication", ErrorKind::AuthenticationRejected},
    {"a file was not found", ErrorKind::FileNotFound},
    {"file not found", ErrorKind::FileNotFound},
    {"no such file", ErrorKind::FileNotFound},
    {"tools are not running", ErrorKind::ToolsUnavailable},
    {"tools are not installed", ErrorKind::ToolsUnavailable},
    {"cannot open vm", ErrorKind::VmNotFound},
    {"virtual machine cannot be found", ErrorKind::VmNotFound},
    {"vmx file was not found", ErrorKind::VmNotFound},
    {"unable to connect to host", ErrorKind::HostUnreachable},
    {"cannot connect to host", ErrorKind::HostUnreachable},
    {"snapshot", ErrorKind::SnapshotFailure},
    {"timed out", ErrorKind::TimedOut},
};

std::string to_lower(std::string_view str) {
    std::string res(str.size(), '\0');
    ranges::transform(str, res.begin(), [](unsigned char chr) { return static_cast<char>(std::tolower(chr)); });
    return res;
}

std::string_view trim(std::string_view str) {
    constexpr std::string_view WHITESPACE = " \t\r\n";

    const auto first = str.find_first_not_of(WHITESPACE);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = str.find_last_not_of(WHITESPACE);

    return str.substr(first, last - first + 1);
}

std::vector<std::string_view> split_lines(std::string_view str) {
    std::vector<std::string_view> lines;

    while (!str.empty()) {
        const auto eol = str.find('\n');
        std::string_view line = str.substr(0, eol);
        if (line.ends_with('\r')) {
            line.remove_suffix(1);
        }
        lines.push_back(line);

        if (eol == std::string_view::npos) {
            break;
        }
        str.remove_prefix(eol + 1);
    }

    return lines;
}

std::optional<int> parse_int(std::string_view str) {
    int res{};
    const auto* end = str.data() + str.size();
    const auto [ptr, ec] = std::from_chars(str.data(), end, res);

    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }

    return res;
}

} // namespace

VmrunDriver::VmrunDriver(std::string vmrun_path, std::string host_type)
    : vmrun_path_{std::move(vmrun_path)}
    , host_type_{std::move(host_type)} {}

std::vector<std::string> VmrunDriver::make_args(std::string_view command, NeedsGuest needs_guest,
                                                const std::vector<std::string>& rest) const {
    std::vector<std::string> args{"-T", host_type_};

    if (needs_guest == NeedsGuest::Yes) {
        std::lock_guard lock{mutex_};
        if (credentials_) {
            args.insert(args.end(), {"-gu", credentials_->username, "-gp", credentials_->password});
        }
    }

    args.emplace_back(command);
    args.insert(args.end(), rest.begin(), rest.end());

    return args;
}

Result<std::string> VmrunDriver::vmrun(std::string_view command, NeedsGuest needs_guest,
                                       const std::vector<std::string>& rest, ErrorKind fallback) const {
    // Only the command is logged; the full argument list may hold the guest password
    LOG_TRACE("vmrun {} ({} argument(s))", command, rest.size());

    ProcessOutput res = TRYE(Subprocess::run(vmrun_path_, make_args(command, needs_guest, rest)), fallback);

    if (res.exit_code != 0) {
        ErrorKind kind = classify_error(res.output, fallback);
        LOG_DEBUG("vmrun {} failed with exit code {} ({}): {:?}", command, res.exit_code, kind, trim(res.output));
        return kind;
    }

    return std::move(res.output);
}

std::string VmrunDriver::vmx_path() const {
    std::lock_guard lock{mutex_};
    return vmx_path_.value_or("");
}

Result<void> VmrunDriver::connect_host() {
    std::string output = TRY(vmrun("list", NeedsGuest::No, {}, ErrorKind::HostUnreachable));

    LOG_DEBUG("Connected to {} host: {:?}", host_type_, trim(output));

    return {};
}

void VmrunDriver::disconnect_host() {
    LOG_TRACE("Disconnected from {} host", host_type_);
}

Result<void> VmrunDriver::open_vm(const std::string& vm_identifier) {
    // Local host types take a path to the .vmx file; anything else is resolved by the remote host
    if ((host_type_ == "ws" || host_type_ == "player") && !std::filesystem::exists(vm_identifier)) {
        LOG_DEBUG("VM configuration {:?} does not exist", vm_identifier);
        return ErrorKind::VmNotFound;
    }

    std::lock_guard lock{mutex_};
    vmx_path_ = vm_identifier;

    return {};
}

void VmrunDriver::close_vm() {
    std::lock_guard lock{mutex_};
    vmx_path_.reset();
}

Result<std::vector<std::string>> VmrunDriver::list_root_snapshots() {
    std::string output =
        TRY(vmrun("listSnapshots", NeedsGuest::No, {vmx_path(), "showTree"}, ErrorKind::SnapshotFailure));

    auto names = parse_snapshot_list(output);
    if (!names) {
        LOG_DEBUG("Unexpected listSnapshots output: {}", names.error());
        return ErrorKind::SnapshotFailure;
    }

    return names.value();
}

Result<void> VmrunDriver::revert_to_snapshot(const std::string& snapshot_name) {
    const std::string vmx = vmx_path();

    TRY(vmrun("revertToSnapshot", NeedsGuest::No, {vmx, snapshot_name}, ErrorKind::SnapshotFailure));

    // A snapshot taken while powered off reverts into a powered off VM
    TRY(vmrun("start", NeedsGuest::No, {vmx, "nogui"}, ErrorKind::SnapshotFailure));

    return {};
}

Result<void> VmrunDriver::wait_for_tools() {
    using std::chrono::steady_clock;

    const auto deadline = steady_clock::now() + TOOLS_WAIT_LIMIT;

    while (steady_clock::now() < deadline) {
        std::string output = TRY(vmrun("checkToolsState", NeedsGuest::No, {vmx_path()}, ErrorKind::ToolsUnavailable));

        if (trim(output) == "running") {
            return {};
        }

        LOG_TRACE("Guest tools state: {:?}", trim(output));
        std::this_thread::sleep_for(TOOLS_POLL_INTERVAL);
    }

    return ErrorKind::ToolsUnavailable;
}

Result<void> VmrunDriver::login_in_guest(const GuestCredentials& credentials) {
    {
        std::lock_guard lock{mutex_};
        credentials_ = credentials;
    }

    // vmrun has no login; any guest operation validates the credentials
    auto res = vmrun("listProcessesInGuest", NeedsGuest::Yes, {vmx_path()}, ErrorKind::AuthenticationRejected);

    if (!res) {
        std::lock_guard lock{mutex_};
        credentials_.reset();
        return res.error();
    }

    return {};
}

void VmrunDriver::logout_from_guest() {
    std::lock_guard lock{mutex_};
    credentials_.reset();
}

Result<void> VmrunDriver::copy_file_host_to_guest(const std::filesystem::path& host_path,
                                                  const std::string& guest_path) {
    if (!std::filesystem::exists(host_path)) {
        return ErrorKind::FileNotFound;
    }

    TRY(vmrun("CopyFileFromHostToGuest", NeedsGuest::Yes, {vmx_path(), host_path.string(), guest_path},
              ErrorKind::TransferFailed));

    return {};
}

Result<void> VmrunDriver::copy_file_guest_to_host(const std::string& guest_path,
                                                  const std::filesystem::path& host_path) {
    TRY(vmrun("CopyFileFromGuestToHost", NeedsGuest::Yes, {vmx_path(), guest_path, host_path.string()},
              ErrorKind::TransferFailed));

    return {};
}

Result<int> VmrunDriver::run_program_in_guest(const std::string& program, const std::string& command_line) {
    LOG_TRACE("vmrun runProgramInGuest {}", program);

    ProcessOutput res =
        TRYE(Subprocess::run(vmrun_path_, make_args("runProgramInGuest", NeedsGuest::Yes,
                                                    {vmx_path(), program, command_line})),
             ExecutionFailed);

    if (auto exit_code = parse_guest_exit_code(res.exit_code, res.output)) {
        return exit_code.value();
    }

    return classify_error(res.output, ErrorKind::ExecutionFailed);
}

Expected<std::vector<std::string>, std::string> VmrunDriver::parse_snapshot_list(std::string_view output) {
    constexpr std::string_view HEADER = "Total snapshots:";

    const std::vector<std::string_view> lines = split_lines(output);

    if (lines.empty() || !trim(lines.front()).starts_with(HEADER)) {
        return fmt::format("missing {:?} header", HEADER);
    }

    const auto total = parse_int(trim(trim(lines.front()).substr(HEADER.size())));
    if (!total || *total < 0) {
        return fmt::format("bad snapshot count in {:?}", lines.front());
    }

    std::vector<std::string> names;
    std::size_t num_listed = 0;

    for (std::string_view line : lines | ranges::views::drop(1)) {
        if (trim(line).empty()) {
            continue;
        }
        ++num_listed;

        // Children are indented under their parent
        if (line.front() == ' ' || line.front() == '\t') {
            continue;
        }
        names.emplace_back(trim(line));
    }

    if (num_listed != static_cast<std::size_t>(*total)) {
        return fmt::format("header announces {} snapshot(s), but {} were listed", *total, num_listed);
    }

    return names;
}

std::optional<int> VmrunDriver::parse_guest_exit_code(int vmrun_exit_code, std::string_view output) {
    if (vmrun_exit_code == 0) {
        return 0;
    }

    // e.g. "Guest program exited with non-zero exit code: 3"
    constexpr std::string_view MARKER = "exit code:";

    const std::string lowered = to_lower(output);
    const auto pos = lowered.rfind(MARKER);
    if (pos == std::string::npos) {
        return std::nullopt;
    }

    std::string_view rest = std::string_view{output}.substr(pos + MARKER.size());
    rest = trim(rest.substr(0, rest.find('\n')));

    return parse_int(rest);
}

ErrorKind VmrunDriver::classify_error(std::string_view output, ErrorKind fallback) {
    const std::string lowered = to_lower(output);

    for (const auto& [needle, kind] : ERROR_PATTERNS) {
        if (lowered.find(needle) != std::string::npos) {
            return kind;
        }
    }

    return fallback;
}

} // namespace vmchecker

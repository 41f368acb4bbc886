#include "transfer/file_transfer.hpp"

#include "common/error_types.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "vm/guest_session.hpp"

#include <fmt/format.h>
#include <fmt/std.h>

#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace vmchecker {

namespace {

void diagnose(TransferReport& report, TransferDiagnostic::Kind kind, const std::string& file) {
    LOG_WARN("Transfer diagnostic: {} ({:?})", kind, file);
    report.diagnostics.push_back(TransferDiagnostic{.kind = kind, .file = file});
}

} // namespace

FileTransferBridge::FileTransferBridge(const GuestSession& session)
    : session_{&session} {}

TransferReport FileTransferBridge::copy_in(const std::filesystem::path& host_dir, const std::string& guest_dir,
                                           const std::vector<std::string>& relative_files) const {
    TransferReport report;

    for (const std::string& file : relative_files) {
        const std::filesystem::path host_path = host_dir / file;
        const std::string guest_path = guest_dir + file;

        std::error_code err;
        if (!std::filesystem::exists(host_path, err)) {
            diagnose(report, TransferDiagnostic::Kind::MissingOnHost, host_path.string());
            continue;
        }

        LOG_DEBUG("Copying {} -> guest:{}", host_path, guest_path);

        auto res = session_->driver().copy_file_host_to_guest(host_path, guest_path);

        if (!res) {
            if (res.error() == ErrorKind::FileNotFound) {
                diagnose(report, TransferDiagnostic::Kind::MissingOnHost, host_path.string());
                continue;
            }

            throw TransportError(res.error(), fmt::format("Failed to copy {} to guest path {:?}", host_path,
                                                          guest_path));
        }

        report.transferred.push_back(file);
    }

    return report;
}

TransferReport FileTransferBridge::copy_out(const std::filesystem::path& host_dir, const std::string& guest_dir,
                                            const std::vector<std::string>& relative_files) const {
    TransferReport report;

    for (const std::string& file : relative_files) {
        const std::filesystem::path host_path = host_dir / file;
        const std::string guest_path = guest_dir + file;

        // Outputs may be nested, e.g. "results/run.log"
        std::error_code err;
        if (host_path.has_parent_path()) {
            std::filesystem::create_directories(host_path.parent_path(), err);
        }
        if (err) {
            LOG_WARN("Could not create host directory {}: {}", host_path.parent_path(), err.message());
        }

        // A copy left by an earlier script must not pass for this one
        std::filesystem::remove(host_path, err);
        if (err) {
            LOG_WARN("Could not remove stale host copy {}: {}", host_path, err.message());
        }

        LOG_DEBUG("Copying guest:{} -> {}", guest_path, host_path);

        auto res = session_->driver().copy_file_guest_to_host(guest_path, host_path);

        if (!res) {
            if (res.error() != ErrorKind::FileNotFound) {
                throw TransportError(res.error(), fmt::format("Failed to copy guest path {:?} to {}", guest_path,
                                                              host_path));
            }

            diagnose(report, TransferDiagnostic::Kind::MissingInGuest, guest_path);
            continue;
        }

        if (!std::filesystem::exists(host_path, err)) {
            diagnose(report, TransferDiagnostic::Kind::NotRetrieved, host_path.string());
            continue;
        }

        report.transferred.push_back(file);
    }

    return report;
}

} // namespace vmchecker

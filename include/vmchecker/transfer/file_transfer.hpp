#pragma once

#include <vmchecker/common/formatters/enum.hpp>
#include <vmchecker/vm/guest_session.hpp>

#include <boost/describe/enum.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace vmchecker {

/// A non-fatal problem with a single file of a transfer batch. Logged, never raised
struct TransferDiagnostic
{
    enum class Kind {
        MissingOnHost,  ///< copy_in source does not exist on the host; the file was skipped
        MissingInGuest, ///< copy_out source does not exist in the guest
        NotRetrieved,   ///< copy_out reported success, but the file is absent on the host
    };
    BOOST_DESCRIBE_NESTED_ENUM(Kind, MissingOnHost, MissingInGuest, NotRetrieved);

    Kind kind;
    std::string file;
};

struct TransferReport
{
    std::vector<std::string> transferred;
    std::vector<TransferDiagnostic> diagnostics;

    bool complete() const noexcept { return diagnostics.empty(); }
};

/// Best-effort, per-file copies between a host directory and a guest directory.
///
/// ``guest_dir`` is a guest-native directory string that already ends with the guest separator;
/// guest paths are formed as ``guest_dir + relative_file``.
/// A missing file only produces a diagnostic; the remainder of the batch is still attempted.
class FileTransferBridge
{
public:
    explicit FileTransferBridge(const GuestSession& session);

    /// \throws TransportError if the transport fails outright
    TransferReport copy_in(const std::filesystem::path& host_dir, const std::string& guest_dir,
                           const std::vector<std::string>& relative_files) const;

    /// \throws TransportError if the transport fails outright
    TransferReport copy_out(const std::filesystem::path& host_dir, const std::string& guest_dir,
                            const std::vector<std::string>& relative_files) const;

private:
    const GuestSession* session_;
};

} // namespace vmchecker

FMT_SERIALIZE_ENUM(::vmchecker::TransferDiagnostic::Kind);

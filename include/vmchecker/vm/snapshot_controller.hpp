#pragma once

#include <vmchecker/vm/connection_manager.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace vmchecker {

/// Reverts an opened VM to one of its root snapshots, addressed by zero-based ordinal
/// (0 = oldest). Snapshots are never created here.
class SnapshotController
{
public:
    explicit SnapshotController(const VmHandle& vm);

    /// Number of root snapshots, read live from the VM
    /// \throws SnapshotError if the snapshots cannot be listed
    std::size_t snapshot_count() const;

    /// \throws SnapshotOutOfRange if ``index >= snapshot_count()``
    /// \throws SnapshotError if the driver fails to revert
    void revert(std::size_t index) const;

    /// Revert to the most recently taken snapshot, which is treated as the clean baseline
    void revert_to_latest() const;

private:
    std::vector<std::string> list_snapshots() const;

    void revert_impl(const std::vector<std::string>& snapshots, std::size_t index) const;

    const VmHandle* vm_;
};

} // namespace vmchecker

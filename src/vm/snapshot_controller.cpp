#include "vm/snapshot_controller.hpp"

#include "exceptions.hpp"
#include "logging.hpp"
#include "vm/connection_manager.hpp"

#include <fmt/format.h>

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace vmchecker {

SnapshotController::SnapshotController(const VmHandle& vm)
    : vm_{&vm} {}

std::vector<std::string> SnapshotController::list_snapshots() const {
    auto snapshots = vm_->driver().list_root_snapshots();

    if (!snapshots) {
        throw SnapshotError(snapshots.error(), fmt::format("Could not list snapshots of VM {:?}", vm_->identifier()));
    }

    return std::move(snapshots.value());
}

std::size_t SnapshotController::snapshot_count() const {
    return list_snapshots().size();
}

void SnapshotController::revert(std::size_t index) const {
    revert_impl(list_snapshots(), index);
}

void SnapshotController::revert_to_latest() const {
    const auto snapshots = list_snapshots();

    if (snapshots.empty()) {
        throw SnapshotOutOfRange(0, 0);
    }

    revert_impl(snapshots, snapshots.size() - 1);
}

void SnapshotController::revert_impl(const std::vector<std::string>& snapshots, std::size_t index) const {
    if (index >= snapshots.size()) {
        throw SnapshotOutOfRange(index, snapshots.size());
    }

    const std::string& name = snapshots[index];

    LOG_INFO("Reverting VM {:?} to snapshot #{} ({:?})", vm_->identifier(), index, name);

    if (auto res = vm_->driver().revert_to_snapshot(name); !res) {
        throw SnapshotError(res.error(), fmt::format("Could not revert to snapshot {:?}", name));
    }
}

} // namespace vmchecker

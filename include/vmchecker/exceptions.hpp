#pragma once

#include <vmchecker/common/error_types.hpp>
#include <vmchecker/common/formatters/debug.hpp>

#include <fmt/base.h>
#include <fmt/format.h>

#include <cstddef>
#include <stdexcept>
#include <string>

namespace vmchecker {

/// Base of all fatal campaign errors. These propagate to the top-level caller
class VmcheckerError : public std::runtime_error
{
public:
    explicit VmcheckerError(ErrorKind error, const std::string& msg = "")
        : std::runtime_error{msg}
        , error_{error} {}

    ErrorKind get_error() const { return error_; }

private:
    ErrorKind error_ = ErrorKind::UnknownError;
};

/// The driver could not reach the host or locate/open the VM
class ConnectionError : public VmcheckerError
{
public:
    using VmcheckerError::VmcheckerError;
};

/// Requested snapshot ordinal is not within [0, snapshot_count)
class SnapshotOutOfRange : public VmcheckerError
{
public:
    SnapshotOutOfRange(std::size_t index, std::size_t count)
        : VmcheckerError{ErrorKind::SnapshotFailure,
                         fmt::format("Snapshot index {} is out of range (VM has {} snapshots)", index, count)}
        , index_{index}
        , count_{count} {}

    std::size_t get_index() const { return index_; }
    std::size_t get_count() const { return count_; }

private:
    std::size_t index_;
    std::size_t count_;
};

/// Listing or reverting snapshots failed in the driver
class SnapshotError : public VmcheckerError
{
public:
    using VmcheckerError::VmcheckerError;
};

/// Guest tooling never became ready, or the guest rejected the credentials
class GuestLoginError : public VmcheckerError
{
public:
    using VmcheckerError::VmcheckerError;
};

/// A host <-> guest copy failed for a reason other than a missing file
class TransportError : public VmcheckerError
{
public:
    using VmcheckerError::VmcheckerError;
};

/// Configuration file is missing, unparsable, or does not match the schema
class ConfigError : public VmcheckerError
{
public:
    explicit ConfigError(const std::string& msg)
        : VmcheckerError{ErrorKind::BadConfig, msg} {}
};

} // namespace vmchecker

template <>
struct fmt::formatter<::vmchecker::VmcheckerError> : ::vmchecker::DebugFormatter
{
    auto format(const ::vmchecker::VmcheckerError& from, format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{} : {}", from.what(), from.get_error());
    }
};

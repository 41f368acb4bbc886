#pragma once

#include <vmchecker/common/expected.hpp>
#include <vmchecker/common/formatters/enum.hpp>

#include <boost/describe/enum.hpp>
#include <boost/preprocessor/cat.hpp>

namespace vmchecker {

// NOLINTNEXTLINE
enum class ErrorKind {
    TimedOut,               ///< Operation surpassed its timeout
    HostUnreachable,        ///< Could not connect to the virtualization host
    VmNotFound,             ///< The VM identifier could not be located or opened
    SnapshotFailure,        ///< Listing or reverting snapshots failed
    ToolsUnavailable,       ///< Guest tooling never became ready
    AuthenticationRejected, ///< Guest refused the supplied credentials
    FileNotFound,           ///< Source file of a copy does not exist
    TransferFailed,         ///< A copy between host and guest failed outright
    ExecutionFailed,        ///< A program could not be started in the guest
    SyscallFailure,         ///< A Linux syscall failed
    BadConfig,              ///< Configuration is missing or malformed
    UnknownError,           ///< As named; use this as little as possible
};

BOOST_DESCRIBE_ENUM(ErrorKind, TimedOut, HostUnreachable, VmNotFound, SnapshotFailure, ToolsUnavailable,
                    AuthenticationRejected, FileNotFound, TransferFailed, ExecutionFailed, SyscallFailure, BadConfig,
                    UnknownError);

template <typename T>
using Result = Expected<T, ErrorKind>;

} // namespace vmchecker

FMT_SERIALIZE_ENUM(::vmchecker::ErrorKind);

/// If the supplied argument is an error (unexpected) type, then propegate the error type `e` up
/// the call stack. Otherwise, continue execution as normal
// NOLINTBEGIN(bugprone-macro-parentheses)
#define TRYE_IMPL(val, e, ident)                                                                                       \
    __extension__({                                                                                                    \
        const auto& ident = val;                                                                                       \
        if (!ident.has_value()) {                                                                                      \
            using enum ::vmchecker::ErrorKind;                                                                         \
            return e;                                                                                                  \
        }                                                                                                              \
        ident.value();                                                                                                 \
    })

#define TRY_IMPL(val, ident) TRYE_IMPL(val, ident.error(), ident)
// NOLINTEND(bugprone-macro-parentheses)

#define TRYE(val, e) TRYE_IMPL(val, e, BOOST_PP_CAT(errref_uniq__, __COUNTER__))

/// If the supplied argument is an error (unexpected) type, then propegate it up the call stack.
/// Otherwise, continue execution as normal
#define TRY(val) TRY_IMPL(val, BOOST_PP_CAT(errrefe_uniq__, __COUNTER__))

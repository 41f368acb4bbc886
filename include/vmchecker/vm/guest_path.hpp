#pragma once

#include <vmchecker/common/expected.hpp>

#include <fmt/format.h>

#include <string>
#include <string_view>
#include <utility>

namespace vmchecker {

/// A directory inside the guest, in both the guest's native path syntax (used for file copies)
/// and the syntax its shell understands (used in command lines), e.g. for a Cygwin guest:
///   native_style = "C:\\cygwin\\home\\test\\", shell_style = "/home/test/", separator = "\\"
///
/// Both strings always end with their separator. Paths inside the directory are built by
/// concatenation; host-style joining would use the wrong separator.
class GuestRoot
{
public:
    static Expected<GuestRoot, std::string> make(std::string native_style, std::string shell_style,
                                                 std::string separator) {
        if (separator.empty()) {
            return std::string{"guest path separator must not be empty"};
        }

        if (!native_style.ends_with(separator)) {
            return fmt::format("guest native path {:?} must end with separator {:?}", native_style, separator);
        }

        // The shell always sees POSIX-style paths (bash, including Cygwin's), unless it shares the native syntax
        if (!shell_style.ends_with(separator) && !shell_style.ends_with('/')) {
            return fmt::format("guest shell path {:?} must end with a separator", shell_style);
        }

        return GuestRoot{std::move(native_style), std::move(shell_style), std::move(separator)};
    }

    std::string native_path(std::string_view relative) const { return native_style_ + std::string{relative}; }

    std::string shell_path(std::string_view relative) const { return shell_style_ + std::string{relative}; }

    const std::string& native_style() const { return native_style_; }
    const std::string& shell_style() const { return shell_style_; }
    const std::string& separator() const { return separator_; }

private:
    GuestRoot(std::string native_style, std::string shell_style, std::string separator)
        : native_style_{std::move(native_style)}
        , shell_style_{std::move(shell_style)}
        , separator_{std::move(separator)} {}

    std::string native_style_;
    std::string shell_style_;
    std::string separator_;
};

} // namespace vmchecker

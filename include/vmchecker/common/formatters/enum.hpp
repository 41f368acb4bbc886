#pragma once

#include <vmchecker/common/formatters/debug.hpp>

#include <boost/describe/enum.hpp>
#include <boost/describe/enumerators.hpp>
#include <boost/mp11/algorithm.hpp>
#include <boost/type_index.hpp>
#include <fmt/base.h>
#include <fmt/format.h>

#include <string_view>
#include <type_traits>

namespace vmchecker {

/// Name of the enumerator ``value`` as declared with BOOST_DESCRIBE_ENUM, or an empty view if unknown
template <typename Enum>
    requires(boost::describe::has_describe_enumerators<Enum>::value)
constexpr std::string_view enumerator_name(Enum value) {
    std::string_view res;

    boost::mp11::mp_for_each<boost::describe::describe_enumerators<Enum>>([&](auto desc) {
        if (desc.value == value) {
            res = desc.name;
        }
    });

    return res;
}

namespace detail {

/// Formats "Name" normally and "EnumType{Name}" with the '?' spec
template <typename Enum>
struct EnumFormatter : DebugFormatter
{
    auto format(const Enum& from, fmt::format_context& ctx) const {
        std::string_view name = enumerator_name(from);

        if (name.empty()) {
            return fmt::format_to(ctx.out(), "<unknown ({})>", fmt::underlying(from));
        }

        if (is_debug_format) {
            return fmt::format_to(ctx.out(), "{}{{{}}}", boost::typeindex::type_id<Enum>().pretty_name(), name);
        }

        return fmt::format_to(ctx.out(), "{}", name);
    }
};

} // namespace detail

} // namespace vmchecker

/// Specialize fmt::formatter for an enum that has been described with BOOST_DESCRIBE_ENUM
/// Must be used at global scope
#define FMT_SERIALIZE_ENUM(enum_name)                                                                                  \
    template <>                                                                                                        \
    struct fmt::formatter<enum_name> : ::vmchecker::detail::EnumFormatter<enum_name>                                   \
    {                                                                                                                  \
    }

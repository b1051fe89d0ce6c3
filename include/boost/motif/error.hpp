//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/motif
//

#ifndef BOOST_MOTIF_ERROR_HPP
#define BOOST_MOTIF_ERROR_HPP

#include <boost/motif/detail/config.hpp>
#include <boost/system/error_category.hpp>
#include <boost/system/is_error_code_enum.hpp>
#include <system_error>

namespace boost {
namespace motif {

/** Error codes returned when compiling a motif pattern.

    Every value other than `ok` describes a malformed
    pattern string. Compilation stops at the first
    error and produces no pattern.

    @see @ref compile.
*/
enum class error
{
    /// Success
    ok = 0,

    /// The pattern does not end in exactly one period
    missing_terminator,

    /// An element is empty or starts with an unknown character
    invalid_pattern,

    /// A class contains a character outside the alphabet
    invalid_residue,

    /// A class or repeat suffix is not closed properly
    unmatched_bracket,

    /// A class has no options
    empty_class,

    /// A repeat suffix is not one or two counts, or min exceeds max
    invalid_repeat,

    /// A start anchor appears on an element which is not first
    misplaced_start_anchor,

    /// An end anchor appears on an element which is not last
    misplaced_end_anchor,

    /// The optional end marker and a fixed end anchor are mixed
    ambiguous_terminus,

    /// The pattern has more elements than the configured limit
    too_many_elements,

    /// A repeat bound exceeds the configured limit
    repeat_limit
};

} // motif

namespace system {
template<>
struct is_error_code_enum<
    ::boost::motif::error>
{
    static bool const value = true;
};
} // system
} // boost

namespace std {
template<>
struct is_error_code_enum<
    ::boost::motif::error>
    : std::true_type {};
} // std

namespace boost {
namespace motif {

namespace detail {

struct BOOST_SYMBOL_VISIBLE
    error_cat_type
    : system::error_category
{
    BOOST_MOTIF_DECL const char* name(
        ) const noexcept override;
    BOOST_MOTIF_DECL std::string message(
        int) const override;
    BOOST_MOTIF_DECL char const* message(
        int, char*, std::size_t
            ) const noexcept override;
    BOOST_SYSTEM_CONSTEXPR error_cat_type()
        : error_category(0x5d3e91b27a04c8f1)
    {
    }
};

BOOST_MOTIF_DECL extern
    error_cat_type error_cat;

} // detail

inline
BOOST_SYSTEM_CONSTEXPR
system::error_code
make_error_code(
    error ev) noexcept
{
    return system::error_code{
        static_cast<std::underlying_type<
            error>::type>(ev),
        detail::error_cat};
}

} // motif
} // boost

#endif

//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/motif
//

#ifndef BOOST_MOTIF_SYNTAX_REPEAT_RULE_HPP
#define BOOST_MOTIF_SYNTAX_REPEAT_RULE_HPP

#include <boost/motif/detail/config.hpp>
#include <boost/system/result.hpp>
#include <cstddef>

namespace boost {
namespace motif {

/** The repeat bounds of an element.

    Both bounds are inclusive.
*/
struct repeat_range
{
    std::size_t min = 1;
    std::size_t max = 1;
};

//------------------------------------------------

namespace implementation_defined {
struct repeat_rule_t
{
    using value_type = repeat_range;

    BOOST_MOTIF_DECL
    auto
    parse(
        char const*&,
        char const*) const noexcept ->
            system::result<value_type>;
};
} // implementation_defined

/** Rule matching an optional repeat suffix

    An empty input yields the default bounds `(1,1)`.
    A single count sets both bounds.

    @par Value Type
    @code
    using value_type = repeat_range;
    @endcode

    @par Example
    @code
    system::result< repeat_range > rv =
        grammar::parse( "(2,4)", repeat_rule );
    @endcode

    @par BNF
    @code
    repeat      = "(" count [ "," count ] ")"
    count       = dec-number
    @endcode

    @see
        @ref repeat_range.
*/
BOOST_INLINE_CONSTEXPR implementation_defined::repeat_rule_t repeat_rule{};

} // motif
} // boost

#endif

//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/motif
//

#ifndef BOOST_MOTIF_SYNTAX_ELEMENT_RULE_HPP
#define BOOST_MOTIF_SYNTAX_ELEMENT_RULE_HPP

#include <boost/motif/detail/config.hpp>
#include <boost/motif/element.hpp>
#include <boost/system/result.hpp>
#include <boost/url/grammar/lut_chars.hpp>

namespace boost {
namespace motif {

namespace implementation_defined {
class element_rule_t
{
    grammar::lut_chars residues_;

public:
    using value_type = element;

    constexpr
    explicit
    element_rule_t(
        grammar::lut_chars const& residues) noexcept
        : residues_(residues)
    {
    }

    BOOST_MOTIF_DECL
    auto
    parse(
        char const*&,
        char const*) const noexcept ->
            system::result<value_type>;
};
} // implementation_defined

/** Return a rule matching one element of a pattern

    The rule consumes the whole input: a trailing `>`
    is taken as the end anchor, so the input must be a
    single element with the `-` separators removed.
    The returned element has no successor.

    @par Value Type
    @code
    using value_type = element;
    @endcode

    @par Example
    @code
    system::result< element > rv = grammar::parse(
        "<[AT](2,3)", element_rule( amino_acid_chars ) );
    @endcode

    @par BNF
    @code
    element     = [ "<" ] body [ repeat ] [ ">" ]
    body        = residue / "x" / class / negated-class
    @endcode

    @param residues The characters accepted as residues.

    @see
        @ref element,
        @ref repeat_rule,
        @ref residue_set_rule.
*/
constexpr
implementation_defined::element_rule_t
element_rule(
    grammar::lut_chars const& residues) noexcept
{
    return implementation_defined::element_rule_t(residues);
}

} // motif
} // boost

#endif

//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/motif
//

#ifndef BOOST_MOTIF_SYNTAX_RESIDUE_SET_RULE_HPP
#define BOOST_MOTIF_SYNTAX_RESIDUE_SET_RULE_HPP

#include <boost/motif/detail/config.hpp>
#include <boost/system/result.hpp>
#include <boost/url/grammar/lut_chars.hpp>

namespace boost {
namespace motif {

/** The body of a residue class.
*/
struct residue_set
{
    /// The residues listed between the brackets.
    grammar::lut_chars options{""};

    /// True if the end marker `>` was listed.
    bool allow_end = false;
};

//------------------------------------------------

namespace implementation_defined {
class residue_set_rule_t
{
    grammar::lut_chars residues_;
    char open_;
    char close_;

public:
    using value_type = residue_set;

    constexpr
    residue_set_rule_t(
        grammar::lut_chars const& residues,
        char open,
        char close) noexcept
        : residues_(residues)
        , open_(open)
        , close_(close)
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

/** Return a rule matching a bracketed set of residues

    Only a set opened with `[` may list the end marker
    `>`, and only once. A set must list at least one
    residue or the end marker.

    @par Value Type
    @code
    using value_type = residue_set;
    @endcode

    @par Example
    @code
    system::result< residue_set > rv = grammar::parse(
        "[AT>]", residue_set_rule( amino_acid_chars, '[', ']' ) );
    @endcode

    @par BNF
    @code
    class         = "[" 1*( residue / ">" ) "]"
    negated-class = "{" 1*residue "}"
    @endcode

    @param residues The characters accepted as residues.
    @param open The opening bracket.
    @param close The closing bracket.

    @see
        @ref residue_set.
*/
constexpr
implementation_defined::residue_set_rule_t
residue_set_rule(
    grammar::lut_chars const& residues,
    char open,
    char close) noexcept
{
    return { residues, open, close };
}

} // motif
} // boost

#endif

//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/motif
//

#ifndef BOOST_MOTIF_ELEMENT_HPP
#define BOOST_MOTIF_ELEMENT_HPP

#include <boost/motif/detail/config.hpp>
#include <boost/motif/match.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/url/grammar/lut_chars.hpp>
#include <cstddef>
#include <string>

namespace boost {
namespace motif {

/** The kind of position an element accepts.
*/
enum class element_kind : unsigned char
{
    /// One specific residue
    literal,

    /// Any character
    wildcard,

    /// Any residue of a set, or any character outside it
    residue_class
};

/** One position, or repeated run of positions, of a pattern.

    Elements are produced by @ref element_rule and owned
    by a @ref pattern, which links them into a chain by
    index. Once the pattern is built its elements are
    never modified.

    @par BNF
    @code
    element     = [ "<" ] body [ repeat ] [ ">" ]
    body        = residue / "x" / class / negated-class
    class       = "[" 1*( residue / ">" ) "]"
    negated-class = "{" 1*residue "}"
    repeat      = "(" count [ "," count ] ")"
    @endcode
*/
struct element
{
    /// The value of @ref next for the last element.
    static constexpr std::size_t npos = std::size_t(-1);

    /// What this element accepts.
    element_kind kind = element_kind::wildcard;

    /// The residue, for a literal.
    char residue = 0;

    /// Options of a residue class.
    grammar::lut_chars options{""};

    /// True if options lists the rejected residues.
    bool negate = false;

    /** True if the class also accepts the end of the sequence.

        The end of the sequence matches with zero width.
    */
    bool allow_end = false;

    /// Must occur at the start of the sequence.
    bool start_anchor = false;

    /// Must occur at the end of the sequence.
    bool end_anchor = false;

    std::size_t min_repeats = 1;
    std::size_t max_repeats = 1;

    /// Index of the successor in the owning pattern.
    std::size_t next = npos;

    bool
    has_next() const noexcept
    {
        return next != npos;
    }

    /** Test only this element at one offset.

        Repeats and successors are not considered.
        A class which allows the end of the sequence
        returns a zero-width match at the end.

        @return A match of extent 1, 0 at the end of the
        sequence, or a failed match.
    */
    BOOST_MOTIF_DECL
    match
    matches_at(
        core::string_view sequence,
        std::size_t offset) const noexcept;
};

/** Return the pattern syntax for an element.

    The result does not include the successor. Class
    options are listed in ascending character order, and
    a repeat suffix is written unless it is `(1,1)`.

    @par Example
    @code
    element e = grammar::parse( "[TA>](1,2)",
        element_rule( amino_acid_chars ) ).value();
    assert( to_string( e ) == "[AT>](1,2)" );
    @endcode
*/
BOOST_MOTIF_DECL
std::string
to_string(element const& e);

} // motif
} // boost

#endif

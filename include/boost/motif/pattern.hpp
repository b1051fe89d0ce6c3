//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/motif
//

#ifndef BOOST_MOTIF_PATTERN_HPP
#define BOOST_MOTIF_PATTERN_HPP

#include <boost/motif/detail/config.hpp>
#include <boost/motif/element.hpp>
#include <boost/motif/match.hpp>
#include <boost/motif/pattern_config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/result.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace boost {
namespace motif {

class pattern;

/** Compile a motif pattern.

    The pattern is a list of elements separated by dashes
    and terminated by a single period:

    @li A residue such as `A` matches that residue.
    @li `x` matches any residue.
    @li `[AC]` matches any of the listed residues.
    @li `{AC}` matches anything except the listed residues.
    @li `<` before the first element anchors it to the
        start of the sequence.
    @li `>` after the last element anchors it to the end
        of the sequence.
    @li `>` inside square brackets also accepts the end
        of the sequence.
    @li `(n)` or `(n,m)` after an element repeats it
        exactly `n` times, or `n` to `m` times.

    @par Example
    @code
    system::result< pattern > rv = compile( "K-I-T(2)-Y(1,3)." );
    if( rv )
        std::size_t pos = rv->find( "HEYKITTYKITTY" );
    @endcode

    @par BNF
    @code
    pattern     = element *( "-" element ) "."
    @endcode

    @param s The pattern string.

    @param cfg The compiler configuration.

    @return The compiled pattern, or an @ref error.

    @throws std::invalid_argument `cfg` is invalid.
*/
BOOST_MOTIF_DECL
system::result<pattern>
compile(
    core::string_view s,
    pattern_config const& cfg = {});

//------------------------------------------------

/** A compiled motif pattern.

    A pattern is immutable. Its const member functions
    may be called concurrently from multiple threads.

    Elements are stored in an arena filled from the last
    element to the first; the head is the final entry
    and each element names its successor by index.

    The anchored elements are cached so that searches
    only try offsets where the anchors can hold: offset
    0 under a start anchor, and offsets within reach of
    the end under an end anchor.

    @see @ref compile.
*/
class pattern
{
    std::vector<element> elems_;
    std::string str_;
    std::size_t start_ = element::npos;
    std::size_t end_ = element::npos;
    std::size_t reach_ = 0;

    friend
    system::result<pattern>
    compile(
        core::string_view,
        pattern_config const&);

    pattern() = default;

    std::size_t first_offset(
        std::size_t size) const noexcept;
    std::size_t last_offset(
        std::size_t size) const noexcept;

public:
    /// Returned by @ref find when there is no match.
    static constexpr std::size_t npos = std::size_t(-1);

    /** Constructor.

        Compiles the pattern string.

        @throws system::system_error The pattern is
        malformed. The exception holds an @ref error.

        @throws std::invalid_argument `cfg` is invalid.

        @see @ref compile.
    */
    BOOST_MOTIF_DECL
    explicit
    pattern(
        core::string_view s,
        pattern_config const& cfg = {});

    /// Return the string this pattern was compiled from.
    core::string_view
    str() const noexcept
    {
        return str_;
    }

    /// Return the number of elements.
    std::size_t
    size() const noexcept
    {
        return elems_.size();
    }

    /** Return the element arena.

        The last element of the pattern comes first.
    */
    std::vector<element> const&
    elements() const noexcept
    {
        return elems_;
    }

    /// Return the first element of the pattern.
    element const&
    head() const noexcept
    {
        return elems_.back();
    }

    /** Return the successor of an element.

        @return The successor, or `nullptr` for the
        last element.
    */
    element const*
    next(element const& e) const noexcept
    {
        if(! e.has_next())
            return nullptr;
        return &elems_[e.next];
    }

    /// Return the start-anchored element, or `nullptr`.
    element const*
    start_anchor() const noexcept
    {
        if(start_ == element::npos)
            return nullptr;
        return &elems_[start_];
    }

    /// Return the end-anchored element, or `nullptr`.
    element const*
    end_anchor() const noexcept
    {
        if(end_ == element::npos)
            return nullptr;
        return &elems_[end_];
    }

    /** Match the whole pattern at one offset.

        Repeats are tried greedily, largest count first,
        falling back to smaller counts when the rest of
        the pattern cannot match. The first successful
        assignment is returned.

        @return The match, whose extent covers every
        element of the pattern. An offset past the end
        of the sequence never matches.
    */
    BOOST_MOTIF_DECL
    match
    match_at(
        core::string_view sequence,
        std::size_t offset) const;

    /** Return every span of the pattern at one offset.

        Unlike @ref match_at, every repeat count which
        leads to a complete match contributes a span.
        Each span starts at `offset`.
    */
    BOOST_MOTIF_DECL
    std::vector<match_location>
    match_all_at(
        core::string_view sequence,
        std::size_t offset) const;

    /** Find the first occurrence of the pattern.

        @param sequence The sequence to search.

        @param pos The first offset to try.

        @return The offset of the first occurrence at or
        after `pos`, or @ref npos.
    */
    BOOST_MOTIF_DECL
    std::size_t
    find(
        core::string_view sequence,
        std::size_t pos = 0) const;

    /** Find every occurrence of the pattern.

        Spans are ordered by start offset, then by the
        order repeat counts were tried. Overlapping and
        nested spans are all returned.
    */
    BOOST_MOTIF_DECL
    std::vector<match_location>
    find_all(
        core::string_view sequence) const;
};

} // motif
} // boost

#endif

//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/motif
//

#ifndef BOOST_MOTIF_MATCH_HPP
#define BOOST_MOTIF_MATCH_HPP

#include <boost/motif/detail/config.hpp>
#include <cstddef>
#include <iosfwd>

namespace boost {
namespace motif {

/** The outcome of matching part of a pattern at one offset.

    A default constructed match represents "no match".
    Otherwise the match carries its extent, the number
    of sequence positions consumed by the element and
    everything after it.

    @par Example
    @code
    match m = p.match_at( "MAGICHAT", 1 );
    if( m )
        std::cout << m.extent();
    @endcode
*/
class match
{
    std::size_t extent_ = 0;
    bool hit_ = false;

public:
    /** Constructor.

        Constructs a match representing failure.
    */
    match() = default;

    /** Constructor.

        Constructs a successful match.

        @param extent The number of positions consumed.
    */
    explicit
    match(std::size_t extent) noexcept
        : extent_(extent)
        , hit_(true)
    {
    }

    /// Return true if this is a successful match.
    bool
    has_value() const noexcept
    {
        return hit_;
    }

    /// Return true if this is a successful match.
    explicit
    operator bool() const noexcept
    {
        return hit_;
    }

    /** Return the number of positions consumed.

        @throws std::logic_error `! this->has_value()`
    */
    BOOST_MOTIF_DECL
    std::size_t
    extent() const;
};

//------------------------------------------------

/** A half-open span of a searched sequence.

    Identifies one complete occurrence of a pattern,
    from `start` up to but not including `end`.
*/
struct match_location
{
    /// Offset of the first position.
    std::size_t start = 0;

    /// Offset one past the last position.
    std::size_t end = 0;

    /// Return the number of positions in the span.
    std::size_t
    size() const noexcept
    {
        return end - start;
    }

    friend
    bool
    operator==(
        match_location const& a,
        match_location const& b) noexcept
    {
        return
            a.start == b.start &&
            a.end == b.end;
    }

    friend
    bool
    operator!=(
        match_location const& a,
        match_location const& b) noexcept
    {
        return !(a == b);
    }
};

/** Format a match location to an output stream.

    The output has the form
    `match from 6 to 8 (length: 2)`.
*/
BOOST_MOTIF_DECL
std::ostream&
operator<<(
    std::ostream& os,
    match_location const& loc);

} // motif
} // boost

#endif

//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/motif
//

#include <boost/motif/match.hpp>
#include <boost/motif/detail/except.hpp>
#include <ostream>

namespace boost {
namespace motif {

std::size_t
match::
extent() const
{
    if(! hit_)
        detail::throw_logic_error(
            "extent of a failed match");
    return extent_;
}

std::ostream&
operator<<(
    std::ostream& os,
    match_location const& loc)
{
    os <<
        "match from " << loc.start <<
        " to " << loc.end <<
        " (length: " << loc.size() << ")";
    return os;
}

} // motif
} // boost

//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/motif
//

#include <boost/motif/error.hpp>

namespace boost {
namespace motif {
namespace detail {

const char*
error_cat_type::
name() const noexcept
{
    return "boost.motif";
}

std::string
error_cat_type::
message(int ev) const
{
    return message(ev, nullptr, 0);
}

char const*
error_cat_type::
message(
    int ev,
    char*,
    std::size_t) const noexcept
{
    switch(static_cast<error>(ev))
    {
    case error::ok: return "success";
    case error::missing_terminator: return "pattern must end with a period";
    case error::invalid_pattern: return "invalid pattern";
    case error::invalid_residue: return "invalid amino acid";
    case error::unmatched_bracket: return "brackets do not match";
    case error::empty_class: return "no valid options provided";
    case error::invalid_repeat: return "invalid repeat";
    case error::misplaced_start_anchor: return "start anchor must be on the first element";
    case error::misplaced_end_anchor: return "end anchor must be on the last element";
    case error::ambiguous_terminus: return "optional and fixed end anchors are mixed";
    case error::too_many_elements: return "too many elements";
    case error::repeat_limit: return "repeat limit exceeded";
    default:
        return "unknown";
    }
}

#if defined(__cpp_constinit) && __cpp_constinit >= 201907L
constinit error_cat_type error_cat;
#else
error_cat_type error_cat;
#endif

} // detail
} // motif
} // boost

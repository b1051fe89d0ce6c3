//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/motif
//

#include <boost/motif/syntax/residue_set_rule.hpp>
#include <boost/motif/error.hpp>

namespace boost {
namespace motif {
namespace implementation_defined {

namespace {

constexpr grammar::lut_chars closing_chars = "]}";

} // (anon)

auto
residue_set_rule_t::
parse(
    char const*& it,
    char const* end) const noexcept ->
        system::result<value_type>
{
    if( it == end ||
        *it != open_)
        BOOST_MOTIF_RETURN_EC(
            error::unmatched_bracket);
    ++it;

    value_type v;
    bool any = false;
    for(;;)
    {
        if(it == end)
            BOOST_MOTIF_RETURN_EC(
                error::unmatched_bracket);
        char const c = *it;
        if(c == close_)
            break;
        if(closing_chars(c))
            BOOST_MOTIF_RETURN_EC(
                error::unmatched_bracket);
        if(c == '>')
        {
            // only once, and never negated
            if( open_ != '[' ||
                v.allow_end)
                BOOST_MOTIF_RETURN_EC(
                    error::invalid_residue);
            v.allow_end = true;
            ++it;
            continue;
        }
        if(! residues_(c))
            BOOST_MOTIF_RETURN_EC(
                error::invalid_residue);
        v.options = v.options + grammar::lut_chars(c);
        any = true;
        ++it;
    }
    ++it;

    if( ! any &&
        ! v.allow_end)
        BOOST_MOTIF_RETURN_EC(
            error::empty_class);
    return v;
}

} // implementation_defined
} // motif
} // boost

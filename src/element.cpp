//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/motif
//

#include <boost/motif/element.hpp>

namespace boost {
namespace motif {

match
element::
matches_at(
    core::string_view sequence,
    std::size_t offset) const noexcept
{
    auto const n = sequence.size();
    if(offset >= n)
    {
        // zero-width match on the end of the sequence
        if( kind == element_kind::residue_class &&
            allow_end &&
            offset == n)
            return match(0);
        return {};
    }
    if( start_anchor &&
        offset >= max_repeats)
        return {};
    if( end_anchor &&
        offset + max_repeats < n)
        return {};

    char const c = sequence[offset];
    switch(kind)
    {
    case element_kind::literal:
        if(c != residue)
            return {};
        break;

    case element_kind::wildcard:
        break;

    case element_kind::residue_class:
        if(options(c) == negate)
            return {};
        break;
    }
    return match(1);
}

std::string
to_string(element const& e)
{
    std::string s;
    if(e.start_anchor)
        s.push_back('<');
    switch(e.kind)
    {
    case element_kind::literal:
        s.push_back(e.residue);
        break;

    case element_kind::wildcard:
        s.push_back('x');
        break;

    case element_kind::residue_class:
        s.push_back(e.negate ? '{' : '[');
        for(int i = 1; i < 256; ++i)
        {
            auto const c = static_cast<char>(i);
            if(e.options(c))
                s.push_back(c);
        }
        if(e.allow_end)
            s.push_back('>');
        s.push_back(e.negate ? '}' : ']');
        break;
    }
    if( e.min_repeats != 1 ||
        e.max_repeats != 1)
    {
        s.push_back('(');
        s.append(std::to_string(e.min_repeats));
        if(e.max_repeats != e.min_repeats)
        {
            s.push_back(',');
            s.append(std::to_string(e.max_repeats));
        }
        s.push_back(')');
    }
    if(e.end_anchor)
        s.push_back('>');
    return s;
}

} // motif
} // boost

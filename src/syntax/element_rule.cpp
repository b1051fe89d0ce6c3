//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/motif
//

#include <boost/motif/syntax/element_rule.hpp>
#include <boost/motif/syntax/repeat_rule.hpp>
#include <boost/motif/syntax/residue_set_rule.hpp>
#include <boost/motif/error.hpp>

#include <boost/url/grammar/parse.hpp>

namespace boost {
namespace motif {
namespace implementation_defined {

auto
element_rule_t::
parse(
    char const*& it,
    char const* const end) const noexcept ->
        system::result<value_type>
{
    value_type v;

    // terminus markers
    auto last = end;
    if( it != last &&
        *it == '<')
    {
        v.start_anchor = true;
        ++it;
    }
    if( it != last &&
        *(last - 1) == '>')
    {
        v.end_anchor = true;
        --last;
    }
    if(it == last)
        BOOST_MOTIF_RETURN_EC(
            error::invalid_pattern);

    // body
    char const c = *it;
    if(c == 'x')
    {
        v.kind = element_kind::wildcard;
        ++it;
    }
    else if(
        c == '[' ||
        c == '{')
    {
        bool const negate = c == '{';
        auto rv = grammar::parse(
            it, last, residue_set_rule(
                residues_, c, negate ? '}' : ']'));
        if(! rv)
            return rv.error();
        v.kind = element_kind::residue_class;
        v.options = rv->options;
        v.negate = negate;
        v.allow_end = rv->allow_end;
    }
    else if(residues_(c))
    {
        v.kind = element_kind::literal;
        v.residue = c;
        ++it;
    }
    else
    {
        BOOST_MOTIF_RETURN_EC(
            error::invalid_pattern);
    }

    // repeat
    {
        auto rv = grammar::parse(
            it, last, repeat_rule);
        if(! rv)
            return rv.error();
        // stray characters after the element
        if(it != last)
            BOOST_MOTIF_RETURN_EC(
                error::invalid_pattern);
        v.min_repeats = rv->min;
        v.max_repeats = rv->max;
    }

    if( v.end_anchor &&
        v.allow_end)
        BOOST_MOTIF_RETURN_EC(
            error::ambiguous_terminus);

    it = end;
    return v;
}

} // implementation_defined
} // motif
} // boost

//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/motif
//

#include <boost/motif/syntax/repeat_rule.hpp>
#include <boost/motif/error.hpp>

#include <boost/url/grammar/parse.hpp>
#include <boost/url/grammar/unsigned_rule.hpp>

namespace boost {
namespace motif {
namespace implementation_defined {

namespace {

constexpr grammar::unsigned_rule<
    std::size_t> count_rule{};

} // (anon)

auto
repeat_rule_t::
parse(
    char const*& it,
    char const* end) const noexcept ->
        system::result<value_type>
{
    value_type v;
    if(it == end)
        return v;
    if(*it != '(')
        BOOST_MOTIF_RETURN_EC(
            error::invalid_pattern);
    ++it;

    // min
    {
        if(it == end)
            BOOST_MOTIF_RETURN_EC(
                error::unmatched_bracket);
        auto rv = grammar::parse(
            it, end, count_rule);
        if(! rv)
            BOOST_MOTIF_RETURN_EC(
                error::invalid_repeat);
        v.min = *rv;
        v.max = *rv;
    }

    // [ "," max ]
    if( it != end &&
        *it == ',')
    {
        ++it;
        if(it == end)
            BOOST_MOTIF_RETURN_EC(
                error::unmatched_bracket);
        auto rv = grammar::parse(
            it, end, count_rule);
        if(! rv)
            BOOST_MOTIF_RETURN_EC(
                error::invalid_repeat);
        v.max = *rv;
    }

    if(it == end)
        BOOST_MOTIF_RETURN_EC(
            error::unmatched_bracket);
    if(*it != ')')
        BOOST_MOTIF_RETURN_EC(
            error::invalid_repeat);
    ++it;

    if(v.min > v.max)
        BOOST_MOTIF_RETURN_EC(
            error::invalid_repeat);
    return v;
}

} // implementation_defined
} // motif
} // boost

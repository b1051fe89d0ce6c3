//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/motif
//

#include <boost/motif/pattern.hpp>
#include <boost/motif/error.hpp>
#include <boost/motif/detail/except.hpp>
#include <boost/motif/syntax/element_rule.hpp>
#include "src/detail/engine.hpp"

#include <boost/url/grammar/charset.hpp>
#include <boost/url/grammar/parse.hpp>
#include <utility>

namespace boost {
namespace motif {

namespace {

constexpr grammar::lut_chars separator_chars('-');

} // (anon)

system::result<pattern>
compile(
    core::string_view s,
    pattern_config const& cfg)
{
    auto const residues =
        detail::make_residue_chars(cfg);

    // exactly one trailing period
    if( s.empty() ||
        s.back() != '.')
        BOOST_MOTIF_RETURN_EC(
            error::missing_terminator);
    if( s.size() >= 2 &&
        s[s.size() - 2] == '.')
        BOOST_MOTIF_RETURN_EC(
            error::missing_terminator);

    // parse elements left to right
    std::vector<element> parsed;
    auto it = s.data();
    auto const end = it + s.size() - 1;
    for(;;)
    {
        if(parsed.size() == cfg.max_elements)
            BOOST_MOTIF_RETURN_EC(
                error::too_many_elements);
        auto const it1 = grammar::find_if(
            it, end, separator_chars);
        auto rv = grammar::parse(
            it, it1, element_rule(residues));
        if(! rv)
            return rv.error();
        if( rv->max_repeats > cfg.max_repeats)
            BOOST_MOTIF_RETURN_EC(
                error::repeat_limit);
        parsed.push_back(*rv);
        if(it1 == end)
            break;
        it = it1 + 1;
    }

    // a class accepting the end of the sequence
    // cannot share a pattern with a fixed end anchor
    bool optional_end = false;
    bool fixed_end = false;
    for(auto const& e : parsed)
    {
        optional_end = optional_end || e.allow_end;
        fixed_end = fixed_end || e.end_anchor;
    }
    if( optional_end &&
        fixed_end)
        BOOST_MOTIF_RETURN_EC(
            error::ambiguous_terminus);

    // link right to left, so each element
    // is attached to its finished successor
    pattern p;
    p.str_.assign(s.data(), s.size());
    p.elems_.reserve(parsed.size());
    for(auto i = parsed.size(); i-- > 0;)
    {
        element e = parsed[i];
        if(! p.elems_.empty())
        {
            if(e.end_anchor)
                BOOST_MOTIF_RETURN_EC(
                    error::misplaced_end_anchor);
            if(p.elems_.back().start_anchor)
                BOOST_MOTIF_RETURN_EC(
                    error::misplaced_start_anchor);
            e.next = p.elems_.size() - 1;
        }
        p.elems_.push_back(e);
    }
    if(p.elems_.back().start_anchor)
        p.start_ = p.elems_.size() - 1;
    if(p.elems_.front().end_anchor)
        p.end_ = 0;

    // longest span, saturating
    for(auto const& e : p.elems_)
    {
        if(e.max_repeats > pattern::npos - p.reach_)
        {
            p.reach_ = pattern::npos;
            break;
        }
        p.reach_ += e.max_repeats;
    }

    // gcc 7 bug workaround
    return system::result<pattern>(std::move(p));
}

//------------------------------------------------

pattern::
pattern(
    core::string_view s,
    pattern_config const& cfg)
{
    auto rv = compile(s, cfg);
    if(! rv)
        detail::throw_system_error(rv.error());
    *this = std::move(*rv);
}

match
pattern::
match_at(
    core::string_view sequence,
    std::size_t offset) const
{
    if(offset > sequence.size())
        return {};
    return detail::match_including_following(
        elems_.data(), elems_.size() - 1,
        sequence, offset);
}

std::vector<match_location>
pattern::
match_all_at(
    core::string_view sequence,
    std::size_t offset) const
{
    std::vector<match_location> v;
    if(offset > sequence.size())
        return v;
    detail::match_all_possible(
        elems_.data(), elems_.size() - 1,
        sequence, offset, v);
    return v;
}

// An end-anchored element which consumes at least
// one position must lie within its repeat bound of
// the end, so no match starts more than reach_ away.
std::size_t
pattern::
first_offset(
    std::size_t size) const noexcept
{
    if( end_ == element::npos ||
        elems_[end_].min_repeats == 0 ||
        size <= reach_)
        return 0;
    return size - reach_;
}

// An anchored head can only match at 0
std::size_t
pattern::
last_offset(
    std::size_t size) const noexcept
{
    if( start_ != element::npos &&
        size > 1)
        return 1;
    return size;
}

std::size_t
pattern::
find(
    core::string_view sequence,
    std::size_t pos) const
{
    auto const last =
        last_offset(sequence.size());
    auto const first =
        first_offset(sequence.size());
    if(pos < first)
        pos = first;
    for(auto i = pos; i < last; ++i)
    {
        if(detail::match_including_following(
            elems_.data(), elems_.size() - 1,
            sequence, i))
            return i;
    }
    return npos;
}

std::vector<match_location>
pattern::
find_all(
    core::string_view sequence) const
{
    std::vector<match_location> v;
    auto const last =
        last_offset(sequence.size());
    for(auto i = first_offset(
            sequence.size()); i < last; ++i)
        detail::match_all_possible(
            elems_.data(), elems_.size() - 1,
            sequence, i, v);
    return v;
}

} // motif
} // boost

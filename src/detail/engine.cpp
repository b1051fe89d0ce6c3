//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/motif
//

#include "src/detail/engine.hpp"

namespace boost {
namespace motif {
namespace detail {

namespace {

constexpr std::size_t npos = std::size_t(-1);

// Returns the number of positions consumed by n
// repeats of e at offset, or npos on a mismatch.
// Only the end of the sequence consumes nothing.
std::size_t
consume(
    element const& e,
    core::string_view sequence,
    std::size_t offset,
    std::size_t n) noexcept
{
    // fewer than n - 1 positions remain
    if(offset + n > sequence.size() + 1)
        return npos;
    std::size_t w = 0;
    for(std::size_t k = 0; k < n; ++k)
    {
        auto const m = e.matches_at(
            sequence, offset + k);
        if(! m)
            return npos;
        w += m.extent();
    }
    return w;
}

} // (anon)

match
match_including_following(
    element const* arena,
    std::size_t i,
    core::string_view sequence,
    std::size_t offset) noexcept
{
    auto const& e = arena[i];
    auto const range = e.max_repeats - e.min_repeats;
    // greedy: largest count first
    for(std::size_t k = 0; k <= range; ++k)
    {
        auto const n = e.max_repeats - k;
        auto const w = consume(e, sequence, offset, n);
        if(w == npos)
            continue;
        // same as the next smaller count
        if( w < n &&
            n > e.min_repeats)
            continue;
        if(! e.has_next())
            return match(w);
        auto const m = match_including_following(
            arena, e.next, sequence, offset + w);
        if(m)
            return match(w + m.extent());
    }
    return {};
}

void
match_all_possible(
    element const* arena,
    std::size_t i,
    core::string_view sequence,
    std::size_t offset,
    std::vector<match_location>& out)
{
    auto const& e = arena[i];
    auto const range = e.max_repeats - e.min_repeats;
    for(std::size_t k = 0; k <= range; ++k)
    {
        auto const n = e.max_repeats - k;
        auto const w = consume(e, sequence, offset, n);
        if(w == npos)
            continue;
        if( w < n &&
            n > e.min_repeats)
            continue;
        if(! e.has_next())
        {
            out.push_back({ offset, offset + w });
            continue;
        }
        // successor spans start at offset + w,
        // rewrite them to start here
        auto const first = out.size();
        match_all_possible(
            arena, e.next, sequence, offset + w, out);
        for(auto j = first; j < out.size(); ++j)
            out[j].start = offset;
    }
}

} // detail
} // motif
} // boost

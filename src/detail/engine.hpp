//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/motif
//

#ifndef BOOST_MOTIF_SRC_DETAIL_ENGINE_HPP
#define BOOST_MOTIF_SRC_DETAIL_ENGINE_HPP

#include <boost/motif/detail/config.hpp>
#include <boost/motif/element.hpp>
#include <boost/motif/match.hpp>
#include <boost/core/detail/string_view.hpp>
#include <vector>

namespace boost {
namespace motif {
namespace detail {

// Matches arena[i] and its successors at offset,
// taking the first repeat assignment that succeeds.
match
match_including_following(
    element const* arena,
    std::size_t i,
    core::string_view sequence,
    std::size_t offset) noexcept;

// Appends every span of arena[i] and its
// successors at offset, for every repeat count.
void
match_all_possible(
    element const* arena,
    std::size_t i,
    core::string_view sequence,
    std::size_t offset,
    std::vector<match_location>& out);

} // detail
} // motif
} // boost

#endif

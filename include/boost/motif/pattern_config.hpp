//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/motif
//

#ifndef BOOST_MOTIF_PATTERN_CONFIG_HPP
#define BOOST_MOTIF_PATTERN_CONFIG_HPP

#include <boost/motif/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/url/grammar/lut_chars.hpp>
#include <cstddef>

namespace boost {
namespace motif {

/** The one-letter codes of the 20 standard amino acids.
*/
BOOST_INLINE_CONSTEXPR core::string_view amino_acids =
    "ACDEFGHIKLMNPQRSTVWY";

/** The character set of the 20 standard amino acids.

    @see @ref amino_acids.
*/
BOOST_INLINE_CONSTEXPR grammar::lut_chars amino_acid_chars =
    "ACDEFGHIKLMNPQRSTVWY";

/** Pattern compiler configuration settings.

    @see @ref compile,
         @ref pattern.
*/
struct pattern_config
{
    /** Characters accepted as literals and class members.

        The alphabet cannot be empty and cannot contain
        any character with a meaning in the pattern syntax.
    */
    core::string_view residues = amino_acids;

    /** Maximum number of elements in one pattern.
    */
    std::size_t max_elements = 64;

    /** Maximum value of a repeat bound.

        Enumerating every span costs the product of the
        repeat ranges along the chain, so large ranges
        should stay rare.
    */
    std::size_t max_repeats = 1000;
};

namespace detail {

// Throws std::invalid_argument when cfg is unusable
BOOST_MOTIF_DECL
grammar::lut_chars
make_residue_chars(
    pattern_config const& cfg);

} // detail

} // motif
} // boost

#endif

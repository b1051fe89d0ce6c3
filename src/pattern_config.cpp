//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/motif
//

#include <boost/motif/pattern_config.hpp>
#include <boost/motif/detail/except.hpp>
#include <string>

namespace boost {
namespace motif {
namespace detail {

namespace {

constexpr grammar::lut_chars syntax_chars =
    "x<>[]{}(),-.";

} // (anon)

grammar::lut_chars
make_residue_chars(
    pattern_config const& cfg)
{
    if(cfg.residues.empty())
        detail::throw_invalid_argument(
            "empty residue alphabet");
    if(cfg.max_elements < 1)
        detail::throw_invalid_argument(
            "max_elements cannot be zero");

    std::string s;
    s.reserve(cfg.residues.size());
    for(char c : cfg.residues)
    {
        if( c == '\0' ||
            syntax_chars(c))
            detail::throw_invalid_argument(
                "residue alphabet contains a syntax character");
        s.push_back(c);
    }
    return grammar::lut_chars(s.c_str());
}

} // detail
} // motif
} // boost

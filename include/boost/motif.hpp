//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/motif
//

#ifndef BOOST_MOTIF_HPP
#define BOOST_MOTIF_HPP

#include <boost/motif/element.hpp>
#include <boost/motif/error.hpp>
#include <boost/motif/match.hpp>
#include <boost/motif/pattern.hpp>
#include <boost/motif/pattern_config.hpp>

#include <boost/motif/syntax/element_rule.hpp>
#include <boost/motif/syntax/repeat_rule.hpp>
#include <boost/motif/syntax/residue_set_rule.hpp>

#endif

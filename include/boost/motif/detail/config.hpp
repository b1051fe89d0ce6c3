//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/motif
//

#ifndef BOOST_MOTIF_DETAIL_CONFIG_HPP
#define BOOST_MOTIF_DETAIL_CONFIG_HPP

#include <boost/config.hpp>
#include <boost/assert/source_location.hpp>
#include <stdint.h>

namespace boost {

namespace motif {

//------------------------------------------------

# if (defined(BOOST_MOTIF_DYN_LINK) || defined(BOOST_ALL_DYN_LINK)) && !defined(BOOST_MOTIF_STATIC_LINK)
#  if defined(BOOST_MOTIF_SOURCE)
#   define BOOST_MOTIF_DECL        BOOST_SYMBOL_EXPORT
#   define BOOST_MOTIF_BUILD_DLL
#  else
#   define BOOST_MOTIF_DECL        BOOST_SYMBOL_IMPORT
#  endif
# endif // shared lib

# ifndef  BOOST_MOTIF_DECL
#  define BOOST_MOTIF_DECL
# endif

# if !defined(BOOST_MOTIF_SOURCE) && !defined(BOOST_ALL_NO_LIB) && !defined(BOOST_MOTIF_NO_LIB)
#  define BOOST_LIB_NAME boost_motif
#  if defined(BOOST_ALL_DYN_LINK) || defined(BOOST_MOTIF_DYN_LINK)
#   define BOOST_DYN_LINK
#  endif
#  include <boost/config/auto_link.hpp>
# endif

//-----------------------------------------------

// Add source location to error codes
#ifdef BOOST_MOTIF_NO_SOURCE_LOCATION
# define BOOST_MOTIF_RETURN_EC(ev) return (ev)
#else
# define BOOST_MOTIF_RETURN_EC(ev)                                 \
    do {                                                                 \
        static constexpr auto loc ## __LINE__((BOOST_CURRENT_LOCATION)); \
        return ::boost::system::error_code((ev), &loc ## __LINE__);      \
    } while(0)
#endif

} // motif

// lift grammar into our namespace
namespace urls {
namespace grammar {}
}
namespace motif {
namespace grammar = ::boost::urls::grammar;
} // motif

} // boost

#endif

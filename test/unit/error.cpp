//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/motif
//

// Test that header file is self-contained.
#include <boost/motif/error.hpp>

#include "test_helpers.hpp"

#include <cstring>

namespace boost {
namespace motif {

struct error_test
{
    void
    check(error ev, char const* msg)
    {
        system::error_code ec = make_error_code(ev);
        BOOST_TEST(ec.failed());
        BOOST_TEST_EQ(ec.message(), msg);
        BOOST_TEST(std::strcmp(
            ec.category().name(), "boost.motif") == 0);
        BOOST_TEST(ec == ev);
    }

    void
    test_codes()
    {
        system::error_code ec = make_error_code(error::ok);
        BOOST_TEST(! ec.failed());
        BOOST_TEST_EQ(ec.message(), "success");

        check(error::missing_terminator, "pattern must end with a period");
        check(error::invalid_pattern, "invalid pattern");
        check(error::invalid_residue, "invalid amino acid");
        check(error::unmatched_bracket, "brackets do not match");
        check(error::empty_class, "no valid options provided");
        check(error::invalid_repeat, "invalid repeat");
        check(error::misplaced_start_anchor, "start anchor must be on the first element");
        check(error::misplaced_end_anchor, "end anchor must be on the last element");
        check(error::ambiguous_terminus, "optional and fixed end anchors are mixed");
        check(error::too_many_elements, "too many elements");
        check(error::repeat_limit, "repeat limit exceeded");
    }

    void
    test_conversion()
    {
        // implicit conversion from the enum
        system::error_code ec = error::invalid_repeat;
        BOOST_TEST(ec == error::invalid_repeat);
        BOOST_TEST(ec != error::invalid_pattern);

        // and to std::error_code
        std::error_code sec = error::empty_class;
        BOOST_TEST(sec.value() ==
            static_cast<int>(error::empty_class));
    }

    void
    test_buffer_message()
    {
        char buf[64];
        BOOST_TEST(std::strcmp(
            detail::error_cat.message(
                static_cast<int>(error::invalid_residue),
                buf, sizeof(buf)),
            "invalid amino acid") == 0);
        BOOST_TEST_EQ(
            detail::error_cat.message(9999),
            "unknown");
    }

    void
    run()
    {
        test_codes();
        test_conversion();
        test_buffer_message();
    }
};

} // motif
} // boost

int
main()
{
    boost::motif::error_test().run();
    return boost::report_errors();
}

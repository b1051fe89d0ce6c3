//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/motif
//

// Test that header file is self-contained.
#include <boost/motif/syntax/repeat_rule.hpp>

#include "test_helpers.hpp"

namespace boost {
namespace motif {

struct repeat_rule_test
{
    void
    bad(core::string_view s, error ev)
    {
        motif::bad(repeat_rule, s, ev);
    }

    void
    ok(
        core::string_view s,
        std::size_t min,
        std::size_t max)
    {
        auto rv = grammar::parse(s, repeat_rule);
        BOOST_TEST(rv.has_value());
        if(! rv.has_value())
            return;
        BOOST_TEST_EQ(rv->min, min);
        BOOST_TEST_EQ(rv->max, max);
    }

    void
    run()
    {
        ok("", 1, 1);
        ok("(5)", 5, 5);
        ok("(5,6)", 5, 6);
        ok("(0,1)", 0, 1);
        ok("(0)", 0, 0);
        ok("(24)", 24, 24);
        ok("(3,3)", 3, 3);

        bad("5", error::invalid_pattern);
        bad("(", error::unmatched_bracket);
        bad("(5", error::unmatched_bracket);
        bad("(5,", error::unmatched_bracket);
        bad("(5,6", error::unmatched_bracket);
        bad("()", error::invalid_repeat);
        bad("(a)", error::invalid_repeat);
        bad("(,2)", error::invalid_repeat);
        bad("(5,)", error::invalid_repeat);
        bad("(1,2,3)", error::invalid_repeat);
        bad("(5;6)", error::invalid_repeat);
        bad("(3,2)", error::invalid_repeat);
        bad("(99999999999999999999999999)", error::invalid_repeat);

        // a second closing parenthesis is left over
        BOOST_TEST(grammar::parse(
            "(5))", repeat_rule).has_error());
    }
};

} // motif
} // boost

int
main()
{
    boost::motif::repeat_rule_test().run();
    return boost::report_errors();
}

//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/motif
//

// Test that header file is self-contained.
#include <boost/motif/pattern.hpp>

#include <boost/motif/error.hpp>
#include <boost/system/system_error.hpp>

#include "test_helpers.hpp"

#include <stdexcept>

namespace boost {
namespace motif {

struct pattern_test
{
    void
    bad(
        core::string_view s,
        error ev,
        pattern_config const& cfg = {})
    {
        auto rv = compile(s, cfg);
        BOOST_TEST(rv.has_error());
        if(rv.has_error())
            BOOST_TEST(rv.error() == ev);
    }

    void
    test_compile()
    {
        auto rv = compile("A.");
        BOOST_TEST(rv.has_value());
        if(! rv.has_value())
            return;
        pattern const& p = *rv;
        BOOST_TEST_EQ(p.size(), 1u);
        BOOST_TEST_EQ(p.str(), "A.");
        BOOST_TEST(p.head().kind == element_kind::literal);
        BOOST_TEST_EQ(p.head().residue, 'A');
        BOOST_TEST(p.next(p.head()) == nullptr);
        BOOST_TEST(p.start_anchor() == nullptr);
        BOOST_TEST(p.end_anchor() == nullptr);
    }

    void
    test_chain()
    {
        pattern p("K-I-T(2)-Y.");
        BOOST_TEST_EQ(p.size(), 4u);

        // the arena holds the last element first
        BOOST_TEST_EQ(p.elements().front().residue, 'Y');
        BOOST_TEST(! p.elements().front().has_next());

        std::string s;
        for(auto e = &p.head(); e; e = p.next(*e))
            s += to_string(*e);
        BOOST_TEST_EQ(s, "KIT(2)Y");

        auto const t = p.next(*p.next(p.head()));
        BOOST_TEST(t != nullptr);
        if(t)
        {
            BOOST_TEST_EQ(t->min_repeats, 2u);
            BOOST_TEST_EQ(t->max_repeats, 2u);
        }
    }

    void
    test_anchors()
    {
        {
            pattern p("<M-A>.");
            BOOST_TEST(p.start_anchor() == &p.head());
            BOOST_TEST(p.end_anchor() == &p.elements().front());
        }
        {
            pattern p("<A>.");
            BOOST_TEST(p.start_anchor() == &p.head());
            BOOST_TEST(p.end_anchor() == &p.head());
        }
        BOOST_TEST(compile("A-[T>](1,2).").has_value());
        BOOST_TEST(compile("[T>]-A.").has_value());

        bad("A-<C.", error::misplaced_start_anchor);
        bad("<A-<C.", error::misplaced_start_anchor);
        bad("A>-C.", error::misplaced_end_anchor);
        bad("[AT>]>.", error::ambiguous_terminus);
        bad("[T>]-A>.", error::ambiguous_terminus);
        bad("A-[T>]-C-D>.", error::ambiguous_terminus);
    }

    void
    test_syntax_errors()
    {
        bad("", error::missing_terminator);
        bad("A", error::missing_terminator);
        bad("AA", error::missing_terminator);
        bad("*", error::missing_terminator);
        bad("A-C", error::missing_terminator);
        bad("A..", error::missing_terminator);
        bad("A-C...", error::missing_terminator);
        bad("..", error::missing_terminator);
        bad(".", error::invalid_pattern);
        bad("A.C.", error::invalid_pattern);
        bad("A--C.", error::invalid_pattern);
        bad("-A.", error::invalid_pattern);
        bad("A-.", error::invalid_pattern);
        bad("*.", error::invalid_pattern);
        bad("AA.", error::invalid_pattern);
        bad("B.", error::invalid_pattern);
        bad("[AC.", error::unmatched_bracket);
        bad("[AC}.", error::unmatched_bracket);
        bad("[AB].", error::invalid_residue);
        bad("[].", error::empty_class);
        bad("{}.", error::empty_class);
        bad("A(5)).", error::invalid_pattern);
        bad("A(2)C.", error::invalid_pattern);
        bad("A-[AC](2)x.", error::invalid_pattern);
        bad("A(2,1).", error::invalid_repeat);
        bad("A(5.", error::unmatched_bracket);
    }

    void
    test_limits()
    {
        pattern_config cfg;
        cfg.max_elements = 2;
        BOOST_TEST(compile("A-C.", cfg).has_value());
        bad("A-C-D.", error::too_many_elements, cfg);

        cfg = {};
        cfg.max_repeats = 5;
        BOOST_TEST(compile("A(0,5).", cfg).has_value());
        bad("A(6).", error::repeat_limit, cfg);
        bad("C-x(2,6).", error::repeat_limit, cfg);
    }

    void
    test_config()
    {
        pattern_config cfg;
        cfg.residues = "ACGT";
        BOOST_TEST(compile("G-[CT](2)-x.", cfg).has_value());
        bad("E.", error::invalid_pattern, cfg);
        bad("[AE].", error::invalid_residue, cfg);

        cfg.residues = "";
        BOOST_TEST_THROWS(compile("A.", cfg), std::invalid_argument);

        cfg.residues = "AxC";
        BOOST_TEST_THROWS(compile("A.", cfg), std::invalid_argument);

        cfg.residues = "A-C";
        BOOST_TEST_THROWS(compile("A.", cfg), std::invalid_argument);

        cfg = {};
        cfg.max_elements = 0;
        BOOST_TEST_THROWS(compile("A.", cfg), std::invalid_argument);
    }

    void
    test_ctor()
    {
        BOOST_TEST_THROWS(pattern("A"), system::system_error);
        try
        {
            pattern p("A-<C.");
            BOOST_TEST(false);
        }
        catch(system::system_error const& e)
        {
            BOOST_TEST(e.code() == error::misplaced_start_anchor);
        }

        pattern p1("[AC]-x(2)-{T}.");
        pattern p2 = p1;
        BOOST_TEST_EQ(p2.str(), p1.str());
        BOOST_TEST_EQ(p2.find("GCGGAA"), p1.find("GCGGAA"));
        BOOST_TEST_EQ(p1.find("GCGGAA"), 1u);
    }

    void
    run()
    {
        test_compile();
        test_chain();
        test_anchors();
        test_syntax_errors();
        test_limits();
        test_config();
        test_ctor();
    }
};

} // motif
} // boost

int
main()
{
    boost::motif::pattern_test().run();
    return boost::report_errors();
}

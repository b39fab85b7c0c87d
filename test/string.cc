// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE string

#include <defs.hh>

#include <string>
#include <tuple>
#include <vector>

#include <boost/test/unit_test.hpp>
namespace utf = boost::unit_test;

#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>
namespace data = boost::unit_test::data;

#include <utils/string.hh>

using namespace rasterkit;

using strings_type = std::vector< std::string >;

BOOST_TEST_DONT_PRINT_LOG_VALUE(strings_type)

BOOST_AUTO_TEST_SUITE(strings)

static const std::vector< std::tuple< std::string, strings_type > >
tokenize_dataset = {
    { "",                             { } },
    { "   \t ",                       { } },
    { "# comment",                    { } },
    { "  #comment",                   { } },
    { "line 0 0 5 5",                 { "line", "0", "0", "5", "5" } },
    { "  line\t0  0 ",                { "line", "0", "0" } },
    { "color #ff0000",                { "color", "#ff0000" } },
    { "color #ff0000 # red",          { "color", "#ff0000" } },
    { "fill 1 2 #",                   { "fill", "1", "2" } },
    { "include \"my file.rc\"",       { "include", "my file.rc" } },
    { "include 'a \"b\" c'",          { "include", "a \"b\" c" } },
    { "include \"unterminated",       { "include", "unterminated" } },
};

BOOST_DATA_TEST_CASE(tokenize_, data::make (tokenize_dataset), text, result) {
    BOOST_TEST (tokenize (text) == result, boost::test_tools::per_element ());
}

BOOST_AUTO_TEST_CASE(split_) {
    BOOST_TEST (split ("a,b,,c", ",") == (strings_type{ "a", "b", "c" }),
                boost::test_tools::per_element ());
    BOOST_TEST (split ("").empty ());
}

BOOST_AUTO_TEST_CASE(numbers) {
    BOOST_TEST (*to_int ("42") == 42);
    BOOST_TEST (*to_int ("-7") == -7);
    BOOST_TEST (!to_int (""));
    BOOST_TEST (!to_int ("4x"));
    BOOST_TEST (!to_int ("1.5"));
    BOOST_TEST (!to_int ("99999999999"));

    BOOST_TEST (*to_double ("1.5") == 1.5);
    BOOST_TEST (*to_double ("-3") == -3.);
    BOOST_TEST (*to_double ("1e2") == 100.);
    BOOST_TEST (!to_double (""));
    BOOST_TEST (!to_double ("1.5.2"));
}

BOOST_AUTO_TEST_CASE(yes_no) {
    BOOST_TEST (*to_yes_no ("yes"));
    BOOST_TEST (!*to_yes_no ("no"));
    BOOST_TEST (!to_yes_no ("true"));
}

BOOST_AUTO_TEST_SUITE_END()

//
// Copyright (c) 2019-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <pgtypes/errc.hpp>
#include <pgtypes/error_code.hpp>

#include <boost/test/unit_test.hpp>

#include <sstream>
#include <string>

using namespace pgtypes;

namespace {

BOOST_AUTO_TEST_SUITE(test_errc)

BOOST_AUTO_TEST_SUITE(error_to_string_)

BOOST_AUTO_TEST_CASE(regular)
{
    BOOST_TEST(error_code(errc::format_error).message() == "The input string was not in a correct format");
    BOOST_TEST(
        error_code(errc::protocol_value_error).message() ==
        "The declared wire length does not match the length required by the type"
    );
}

BOOST_AUTO_TEST_CASE(unknown_error)
{
    BOOST_TEST(error_code(static_cast<errc>(0xfffefdfc)).message() == "<unknown pgtypes error>");
}

BOOST_AUTO_TEST_CASE(coverage)
{
    // Check that no value causes problems.
    // Ensure that all branches of the switch/case are covered
    for (int i = 1; i <= 9; ++i)
    {
        BOOST_TEST_CONTEXT(i)
        {
            BOOST_TEST(error_code(static_cast<errc>(i)).message() != "<unknown pgtypes error>");
        }
    }
}
BOOST_AUTO_TEST_SUITE_END()  // error_to_string_

BOOST_AUTO_TEST_CASE(error_code_from_errc)
{
    error_code code(errc::overflow);
    BOOST_TEST(code.value() == static_cast<int>(errc::overflow));
    BOOST_TEST(&code.category() == &get_pgtypes_category());  // categories are not printable
}

BOOST_AUTO_TEST_CASE(category_name) { BOOST_TEST(get_pgtypes_category().name() == std::string("pgtypes")); }

BOOST_AUTO_TEST_CASE(codes_are_distinct)
{
    // overflow must be distinguishable from a generic format error
    BOOST_TEST(error_code(errc::overflow) != error_code(errc::format_error));
    BOOST_TEST(error_code(errc::invalid_cast) != error_code(errc::invalid_operation));
}

BOOST_AUTO_TEST_CASE(operator_stream)
{
    std::ostringstream oss;
    oss << errc::null_argument;
    BOOST_TEST(oss.str() == "A required argument was null");
}

BOOST_AUTO_TEST_SUITE_END()  // test_errc

}  // namespace

//
// Copyright (c) 2019-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <pgtypes/bad_value_access.hpp>
#include <pgtypes/circle.hpp>
#include <pgtypes/point.hpp>
#include <pgtypes/string_view.hpp>
#include <pgtypes/timestamp.hpp>
#include <pgtypes/value_view.hpp>

#include <boost/test/unit_test.hpp>

#include <sstream>
#include <string>

using namespace pgtypes;

namespace {

BOOST_AUTO_TEST_SUITE(test_value_view)

BOOST_AUTO_TEST_CASE(default_constructor)
{
    value_view v;
    BOOST_TEST(v.is_null());
    BOOST_TEST(v.kind() == value_kind::null);
}

BOOST_AUTO_TEST_CASE(constructors)
{
    std::string text_storage("abc");
    struct
    {
        const char* name;
        value_view v;
        value_kind expected;
    } test_cases[] = {
        {"nullptr",     value_view(nullptr),                         value_kind::null     },
        {"double",      value_view(4.5),                             value_kind::float8   },
        {"string_view", value_view(string_view(text_storage)),       value_kind::text     },
        {"c_str",       value_view("abc"),                           value_kind::text     },
        {"timestamp",   value_view(timestamp::infinity()),           value_kind::timestamp},
        {"point",       value_view(point(1.0, 2.0)),                 value_kind::point    },
        {"circle",      value_view(circle(1.0, 2.0, 3.0)),           value_kind::circle   },
    };

    for (const auto& tc : test_cases)
    {
        BOOST_TEST_CONTEXT(tc.name)
        {
            BOOST_TEST(tc.v.kind() == tc.expected);
            BOOST_TEST(tc.v.is_null() == (tc.expected == value_kind::null));
            BOOST_TEST(tc.v.is_float8() == (tc.expected == value_kind::float8));
            BOOST_TEST(tc.v.is_text() == (tc.expected == value_kind::text));
            BOOST_TEST(tc.v.is_timestamp() == (tc.expected == value_kind::timestamp));
            BOOST_TEST(tc.v.is_point() == (tc.expected == value_kind::point));
            BOOST_TEST(tc.v.is_circle() == (tc.expected == value_kind::circle));
            BOOST_TEST(tc.v.to_variant().index() == static_cast<std::size_t>(tc.expected));
        }
    }
}

BOOST_AUTO_TEST_CASE(accessors)
{
    const timestamp ts(2024, 5, 17, 12, 0, 0);

    BOOST_TEST(value_view(4.5).as_float8() == 4.5);
    BOOST_TEST(value_view(4.5).get_float8() == 4.5);
    BOOST_TEST(value_view("abc").as_text() == "abc");
    BOOST_TEST(value_view("abc").get_text() == "abc");
    BOOST_TEST(value_view(ts).as_timestamp() == ts);
    BOOST_TEST(value_view(ts).get_timestamp() == ts);
    BOOST_TEST(value_view(point(1.0, 2.0)).as_point() == point(1.0, 2.0));
    BOOST_TEST(value_view(point(1.0, 2.0)).get_point() == point(1.0, 2.0));
    BOOST_TEST(value_view(circle(1.0, 2.0, 3.0)).as_circle() == circle(1.0, 2.0, 3.0));
    BOOST_TEST(value_view(circle(1.0, 2.0, 3.0)).get_circle() == circle(1.0, 2.0, 3.0));
}

BOOST_AUTO_TEST_CASE(checked_accessors_error)
{
    value_view null_value;
    BOOST_CHECK_THROW(null_value.as_float8(), bad_value_access);
    BOOST_CHECK_THROW(null_value.as_text(), bad_value_access);
    BOOST_CHECK_THROW(null_value.as_timestamp(), bad_value_access);
    BOOST_CHECK_THROW(null_value.as_point(), bad_value_access);
    BOOST_CHECK_THROW(null_value.as_circle(), bad_value_access);

    // No conversions between kinds
    BOOST_CHECK_THROW(value_view(point(1.0, 2.0)).as_circle(), bad_value_access);
    BOOST_CHECK_THROW(value_view("4.5").as_float8(), bad_value_access);
    BOOST_CHECK_THROW(value_view(4.5).as_text(), bad_value_access);

    BOOST_TEST(std::string(bad_value_access().what()) == "bad_value_access");
}

BOOST_AUTO_TEST_CASE(operator_equals)
{
    std::string s1("abc"), s2("abc");

    BOOST_TEST(value_view() == value_view(nullptr));
    BOOST_TEST(value_view(4.5) == value_view(4.5));
    BOOST_TEST(value_view(4.5) != value_view(4.25));
    BOOST_TEST(value_view(string_view(s1)) == value_view(string_view(s2)));  // compared by contents
    BOOST_TEST(value_view("abc") != value_view("abd"));
    BOOST_TEST(value_view(timestamp::infinity()) == value_view(timestamp::infinity()));
    BOOST_TEST(value_view(timestamp::infinity()) != value_view(timestamp::negative_infinity()));
    BOOST_TEST(value_view(point(1.0, 2.0)) == value_view(point(1.0, 2.0)));
    BOOST_TEST(value_view(circle(1.0, 2.0, 3.0)) != value_view(circle(1.0, 2.0, 4.0)));

    // Different kinds are never equal
    BOOST_TEST(value_view() != value_view(0.0));
    BOOST_TEST(value_view("(1,2)") != value_view(point(1.0, 2.0)));
    BOOST_TEST(value_view(point(1.0, 2.0)) != value_view(circle(1.0, 2.0, 0.0)));
}

BOOST_AUTO_TEST_CASE(operator_stream)
{
    struct
    {
        const char* name;
        value_view v;
        const char* expected;
    } test_cases[] = {
        {"null",      value_view(),                               "<NULL>"             },
        {"double",    value_view(-4.5),                           "-4.5"               },
        {"text",      value_view("abc"),                          "abc"                },
        {"timestamp", value_view(timestamp(2024, 5, 17, 12, 0, 0)), "2024-05-17 12:00:00"},
        {"infinity",  value_view(timestamp::infinity()),          "infinity"           },
        {"point",     value_view(point(1.5, 2.0)),                "(1.5,2)"            },
        {"circle",    value_view(circle(1.5, 2.0, 3.0)),          "<(1.5,2),3>"        },
    };

    for (const auto& tc : test_cases)
    {
        BOOST_TEST_CONTEXT(tc.name)
        {
            std::ostringstream oss;
            oss << tc.v;
            BOOST_TEST(oss.str() == tc.expected);
        }
    }
}

BOOST_AUTO_TEST_CASE(operator_stream_kind)
{
    std::ostringstream oss;
    oss << value_kind::null << ", " << value_kind::float8 << ", " << value_kind::text << ", "
        << value_kind::timestamp << ", " << value_kind::point << ", " << value_kind::circle;
    BOOST_TEST(oss.str() == "null, float8, text, timestamp, point, circle");
}

BOOST_AUTO_TEST_SUITE_END()

}  // namespace

//
// Copyright (c) 2019-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <pgtypes/errc.hpp>
#include <pgtypes/error_code.hpp>
#include <pgtypes/string_view.hpp>
#include <pgtypes/timespan.hpp>

#include <boost/test/unit_test.hpp>

#include <cstdint>
#include <limits>
#include <stdexcept>

using namespace pgtypes;

// std::chrono::duration is not printable before C++20, so we compare tick counts

BOOST_AUTO_TEST_SUITE(test_timespan)

BOOST_AUTO_TEST_CASE(constants)
{
    BOOST_TEST(ticks_per_millisecond == 10000);
    BOOST_TEST(ticks_per_second == 10000000);
    BOOST_TEST(ticks_per_minute == 600000000);
    BOOST_TEST(ticks_per_hour == 36000000000);
    BOOST_TEST(ticks_per_day == 864000000000);
}

BOOST_AUTO_TEST_SUITE(from_double)

BOOST_AUTO_TEST_CASE(success)
{
    BOOST_TEST(from_days(1.5).count() == 1296000000000);
    BOOST_TEST(from_days(-1.0).count() == -ticks_per_day);
    BOOST_TEST(from_hours(2.0).count() == 2 * ticks_per_hour);
    BOOST_TEST(from_hours(-0.5).count() == -30 * ticks_per_minute);
    BOOST_TEST(from_minutes(1.25).count() == 75 * ticks_per_second);
    BOOST_TEST(from_seconds(0.001).count() == ticks_per_millisecond);
    BOOST_TEST(from_milliseconds(0.0).count() == 0);
}

BOOST_AUTO_TEST_CASE(rounding)
{
    // Rounded to the nearest millisecond, halves away from zero
    BOOST_TEST(from_milliseconds(0.4).count() == 0);
    BOOST_TEST(from_milliseconds(1.5).count() == 2 * ticks_per_millisecond);
    BOOST_TEST(from_milliseconds(-1.5).count() == -2 * ticks_per_millisecond);
    BOOST_TEST(from_seconds(0.0004).count() == 0);
    BOOST_TEST(from_seconds(1.0006).count() == 1001 * ticks_per_millisecond);
}

BOOST_AUTO_TEST_CASE(nan)
{
    BOOST_CHECK_THROW(from_days(std::numeric_limits<double>::quiet_NaN()), std::invalid_argument);
    BOOST_CHECK_THROW(from_milliseconds(std::numeric_limits<double>::quiet_NaN()), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(out_of_range)
{
    BOOST_CHECK_THROW(from_days(1e20), std::out_of_range);
    BOOST_CHECK_THROW(from_days(-1e20), std::out_of_range);
    BOOST_CHECK_THROW(from_hours(std::numeric_limits<double>::infinity()), std::out_of_range);
    BOOST_CHECK_THROW(from_seconds(-std::numeric_limits<double>::infinity()), std::out_of_range);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_CASE(to_string)
{
    struct
    {
        const char* name;
        std::int64_t ticks;
        const char* expected;
    } test_cases[] = {
        {"zero",              0,                                           "00:00:00"                    },
        {"hms",               13 * ticks_per_hour + 30 * ticks_per_minute, "13:30:00"                    },
        {"days",              ticks_per_day + 2 * ticks_per_hour + 3 * ticks_per_minute + 4 * ticks_per_second,
         "1.02:03:04"                                                                                    },
        {"fraction",          5,                                           "00:00:00.0000005"            },
        {"millis",            ticks_per_second + 250 * ticks_per_millisecond, "00:00:01.2500000"         },
        {"negative",          -90 * ticks_per_minute,                     "-01:30:00"                   },
        {"negative_days",     -3 * ticks_per_day,                         "-3.00:00:00"                 },
        {"max",               (std::numeric_limits<std::int64_t>::max)(),  "10675199.02:48:05.4775807"   },
        {"min",               (std::numeric_limits<std::int64_t>::min)(),  "-10675199.02:48:05.4775808"  },
    };

    for (const auto& tc : test_cases)
    {
        BOOST_TEST_CONTEXT(tc.name) { BOOST_TEST(timespan_to_string(timespan(tc.ticks)) == tc.expected); }
    }
}

BOOST_AUTO_TEST_CASE(parse_success)
{
    struct
    {
        string_view input;
        std::int64_t expected;
    } test_cases[] = {
        {"00:00",              0                                                                       },
        {"13:30",              13 * ticks_per_hour + 30 * ticks_per_minute                             },
        {"13:30:15",           13 * ticks_per_hour + 30 * ticks_per_minute + 15 * ticks_per_second     },
        {"00:00:00.5",         5000000                                                                 },
        {"00:00:00.0000001",   1                                                                       },
        {"00:00:01.25",        ticks_per_second + 250 * ticks_per_millisecond                          },
        {"23:59:59.9999999",   ticks_per_day - 1                                                       },
        {"1.02:03:04",         ticks_per_day + 2 * ticks_per_hour + 3 * ticks_per_minute + 4 * ticks_per_second},
        {"-01:30",             -90 * ticks_per_minute                                                  },
        {"3",                  3 * ticks_per_day                                                       },
        {"-3",                 -3 * ticks_per_day                                                      },
        {"  12:00 ",           12 * ticks_per_hour                                                     },
        {"10675199.02:48:05.4775807", (std::numeric_limits<std::int64_t>::max)()                      },
    };

    for (const auto& tc : test_cases)
    {
        BOOST_TEST_CONTEXT(tc.input)
        {
            auto res = parse_timespan(tc.input);
            BOOST_TEST_REQUIRE(res.has_value());
            BOOST_TEST(res->count() == tc.expected);
        }
    }
}

BOOST_AUTO_TEST_CASE(parse_error)
{
    struct
    {
        string_view input;
        error_code expected;
    } test_cases[] = {
        {"",                          errc::format_error},
        {"-",                         errc::format_error},
        {"abc",                       errc::format_error},
        {"12:",                       errc::format_error},
        {"12:00:",                    errc::format_error},
        {"12:00:00.",                 errc::format_error},
        {"12:00:00x",                 errc::format_error},
        {"12:00:00.5x",               errc::format_error},
        {"12-00",                     errc::format_error},
        {"1.",                        errc::format_error},
        {"12 :00",                    errc::format_error},
        {"24:00",                     errc::overflow    },
        {"12:60",                     errc::overflow    },
        {"12:00:60",                  errc::overflow    },
        {"00:00:00.12345678",         errc::overflow    },
        {"10675199.02:48:05.4775808", errc::overflow    },
        {"99999999999999999999",      errc::overflow    },
    };

    for (const auto& tc : test_cases)
    {
        BOOST_TEST_CONTEXT(tc.input)
        {
            auto res = parse_timespan(tc.input);
            BOOST_TEST_REQUIRE(res.has_error());
            BOOST_TEST(res.error() == tc.expected);
        }
    }
}

BOOST_AUTO_TEST_CASE(parse_to_string_roundtrip)
{
    std::int64_t values[] = {
        0,
        1,
        ticks_per_day - 1,
        -ticks_per_day - 5 * ticks_per_minute,
        123456789012345,
    };
    for (auto v : values)
    {
        BOOST_TEST_CONTEXT(v)
        {
            auto res = parse_timespan(timespan_to_string(timespan(v)));
            BOOST_TEST_REQUIRE(res.has_value());
            BOOST_TEST(res->count() == v);
        }
    }
}

BOOST_AUTO_TEST_SUITE_END()

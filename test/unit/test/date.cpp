//
// Copyright (c) 2019-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <pgtypes/date.hpp>
#include <pgtypes/errc.hpp>
#include <pgtypes/error_code.hpp>
#include <pgtypes/string_view.hpp>

#include <boost/test/unit_test.hpp>

#include <cstdint>
#include <sstream>
#include <stdexcept>

#include "test_unit/printing.hpp"

using namespace pgtypes;

// Note: the calendar algorithms have been thoroughly covered in
// detail/calendar.cpp, so just spotchecks here

BOOST_AUTO_TEST_SUITE(test_date)

BOOST_AUTO_TEST_CASE(default_constructor)
{
    date d;
    BOOST_TEST(d.year() == 1);
    BOOST_TEST(d.month() == 1u);
    BOOST_TEST(d.day() == 1u);
    BOOST_TEST(d.days_since_era() == 0);
    BOOST_TEST(d == date::era());
}

BOOST_AUTO_TEST_CASE(ctor_from_components)
{
    struct
    {
        std::int32_t year;
        unsigned month;
        unsigned day;
        std::int32_t days_since_era;
    } test_cases[] = {
        {1,       1,  1,  0         },
        {1970,    1,  1,  719162    },
        {2000,    1,  1,  730119    },
        {9999,    12, 31, 3652058   },
        {-1,      12, 31, -1        },
        {-1,      1,  1,  -366      },
        {-4713,   1,  1,  -1721388  },
        {5874897, 12, 31, 2145762067},
    };

    for (const auto& tc : test_cases)
    {
        BOOST_TEST_CONTEXT(tc.year << "-" << tc.month << "-" << tc.day)
        {
            date d(tc.year, tc.month, tc.day);
            BOOST_TEST(d.days_since_era() == tc.days_since_era);
            BOOST_TEST(d.year() == tc.year);
            BOOST_TEST(d.month() == tc.month);
            BOOST_TEST(d.day() == tc.day);
        }
    }
}

BOOST_AUTO_TEST_CASE(ctor_from_components_invalid)
{
    BOOST_CHECK_THROW(date(0, 1, 1), std::out_of_range);
    BOOST_CHECK_THROW(date(2019, 2, 29), std::out_of_range);
    BOOST_CHECK_THROW(date(2019, 0, 1), std::out_of_range);
    BOOST_CHECK_THROW(date(2019, 13, 1), std::out_of_range);
    BOOST_CHECK_THROW(date(2019, 4, 31), std::out_of_range);
    BOOST_CHECK_THROW(date(-4714, 12, 31), std::out_of_range);
    BOOST_CHECK_THROW(date(5874898, 1, 1), std::out_of_range);
}

BOOST_AUTO_TEST_CASE(from_days_since_era)
{
    BOOST_TEST(date::from_days_since_era(0) == date(1, 1, 1));
    BOOST_TEST(date::from_days_since_era(-1721388) == date::min());
    BOOST_TEST(date::from_days_since_era(2145762067) == date::max());
    BOOST_CHECK_THROW(date::from_days_since_era(-1721389), std::out_of_range);
    BOOST_CHECK_THROW(date::from_days_since_era(2145762068), std::out_of_range);
    BOOST_CHECK_THROW(date::from_days_since_era(INT64_MAX), std::out_of_range);
    BOOST_CHECK_THROW(date::from_days_since_era(INT64_MIN), std::out_of_range);
}

BOOST_AUTO_TEST_CASE(constants)
{
    BOOST_TEST(date::epoch() == date(1970, 1, 1));
    BOOST_TEST(date::era() == date(1, 1, 1));
    BOOST_TEST(date::min() == date(-4713, 1, 1));
    BOOST_TEST(date::max() == date(5874897, 12, 31));
}

BOOST_AUTO_TEST_CASE(day_of_year)
{
    BOOST_TEST(date(2024, 1, 1).day_of_year() == 1u);
    BOOST_TEST(date(2024, 3, 1).day_of_year() == 61u);
    BOOST_TEST(date(2023, 3, 1).day_of_year() == 60u);
    BOOST_TEST(date(2024, 12, 31).day_of_year() == 366u);
    BOOST_TEST(date(-1, 12, 31).day_of_year() == 366u);
}

BOOST_AUTO_TEST_CASE(day_of_week)
{
    BOOST_TEST(date(1, 1, 1).day_of_week() == weekday::monday);
    BOOST_TEST(date(1970, 1, 1).day_of_week() == weekday::thursday);
    BOOST_TEST(date(2024, 5, 17).day_of_week() == weekday::friday);
    BOOST_TEST(date(2024, 5, 19).day_of_week() == weekday::sunday);
    BOOST_TEST(date(-1, 12, 31).day_of_week() == weekday::sunday);
}

BOOST_AUTO_TEST_CASE(is_leap_year)
{
    BOOST_TEST(date(2024, 1, 1).is_leap_year());
    BOOST_TEST(date(2000, 1, 1).is_leap_year());
    BOOST_TEST(!date(1900, 1, 1).is_leap_year());
    BOOST_TEST(!date(2023, 1, 1).is_leap_year());
    BOOST_TEST(date(-1, 1, 1).is_leap_year());  // astronomical year 0
    BOOST_TEST(date(-5, 1, 1).is_leap_year());
}

BOOST_AUTO_TEST_CASE(add_days)
{
    BOOST_TEST(date(2024, 2, 28).add_days(1) == date(2024, 2, 29));
    BOOST_TEST(date(2024, 3, 1).add_days(-1) == date(2024, 2, 29));
    BOOST_TEST(date(-1, 12, 31).add_days(1) == date(1, 1, 1));
    BOOST_TEST(date(2024, 5, 17).add_days(0) == date(2024, 5, 17));
    BOOST_TEST(date::min().add_days(2145762067 + 1721388) == date::max());
    BOOST_CHECK_THROW(date::max().add_days(1), std::out_of_range);
    BOOST_CHECK_THROW(date::min().add_days(-1), std::out_of_range);
    BOOST_CHECK_THROW(date().add_days(INT64_MAX), std::out_of_range);
    BOOST_CHECK_THROW(date().add_days(INT64_MIN), std::out_of_range);
}

BOOST_AUTO_TEST_CASE(add_months)
{
    struct
    {
        const char* name;
        date input;
        std::int64_t months;
        date expected;
    } test_cases[] = {
        {"zero",            date(2024, 5, 17), 0,   date(2024, 5, 17)},
        {"same_year",       date(2024, 5, 17), 2,   date(2024, 7, 17)},
        {"next_year",       date(2024, 11, 15), 2,  date(2025, 1, 15)},
        {"prev_year",       date(2024, 1, 15), -1,  date(2023, 12, 15)},
        {"clamp_leap",      date(2024, 1, 31), 1,   date(2024, 2, 29)},
        {"clamp_non_leap",  date(2023, 1, 31), 1,   date(2023, 2, 28)},
        {"clamp_backwards", date(2024, 3, 31), -1,  date(2024, 2, 29)},
        {"clamp_30",        date(2024, 3, 31), 1,   date(2024, 4, 30)},
        {"to_bc",           date(1, 1, 1),     -1,  date(-1, 12, 1)  },
        {"from_bc",         date(-1, 12, 1),   1,   date(1, 1, 1)    },
        {"many_years",      date(2024, 5, 17), 120, date(2034, 5, 17)},
    };

    for (const auto& tc : test_cases)
    {
        BOOST_TEST_CONTEXT(tc.name) { BOOST_TEST(tc.input.add_months(tc.months) == tc.expected); }
    }
}

BOOST_AUTO_TEST_CASE(add_months_out_of_range)
{
    BOOST_CHECK_THROW(date::max().add_months(1), std::out_of_range);
    BOOST_CHECK_THROW(date::min().add_months(-1), std::out_of_range);
    BOOST_CHECK_THROW(date().add_months(INT64_MAX), std::out_of_range);
    BOOST_CHECK_THROW(date().add_months(INT64_MIN), std::out_of_range);
}

BOOST_AUTO_TEST_CASE(add_years)
{
    BOOST_TEST(date(2024, 5, 17).add_years(1) == date(2025, 5, 17));
    BOOST_TEST(date(2024, 2, 29).add_years(1) == date(2025, 2, 28));
    BOOST_TEST(date(2024, 2, 29).add_years(4) == date(2028, 2, 29));
    BOOST_TEST(date(2024, 5, 17).add_years(-2024) == date(-1, 5, 17));

    // There is no year zero
    BOOST_TEST(date(-1, 6, 1).add_years(1) == date(1, 6, 1));
    BOOST_TEST(date(2, 6, 1).add_years(-2) == date(-1, 6, 1));

    BOOST_CHECK_THROW(date::max().add_years(1), std::out_of_range);
    BOOST_CHECK_THROW(date::min().add_years(-1), std::out_of_range);
    BOOST_CHECK_THROW(date().add_years(INT64_MAX), std::out_of_range);
    BOOST_CHECK_THROW(date().add_years(INT64_MIN), std::out_of_range);
}

BOOST_AUTO_TEST_CASE(to_string)
{
    BOOST_TEST(date(2024, 5, 17).to_string() == "2024-05-17");
    BOOST_TEST(date(1, 1, 1).to_string() == "0001-01-01");
    BOOST_TEST(date(-1, 12, 31).to_string() == "0001-12-31 BC");
    BOOST_TEST(date(-44, 3, 15).to_string() == "0044-03-15 BC");
    BOOST_TEST(date::min().to_string() == "4713-01-01 BC");
    BOOST_TEST(date::max().to_string() == "5874897-12-31");
}

BOOST_AUTO_TEST_CASE(parse_success)
{
    struct
    {
        string_view input;
        date expected;
    } test_cases[] = {
        {"2024-05-17",          date(2024, 5, 17)   },
        {"0001-01-01",          date(1, 1, 1)       },
        {"1-1-1",               date(1, 1, 1)       },
        {"0044-03-15 BC",       date(-44, 3, 15)    },
        {"0044-03-15 bc",       date(-44, 3, 15)    },
        {"0044-03-15   Bc",     date(-44, 3, 15)    },
        {"2024-05-17 AD",       date(2024, 5, 17)   },
        {"  2024-05-17 \t",     date(2024, 5, 17)   },
        {"5874897-12-31",       date(5874897, 12, 31)},
        {"4713-01-01 BC",       date(-4713, 1, 1)   },
        {"2024-02-29",          date(2024, 2, 29)   },
    };

    for (const auto& tc : test_cases)
    {
        BOOST_TEST_CONTEXT(tc.input)
        {
            auto res = date::parse(tc.input);
            BOOST_TEST_REQUIRE(res.has_value());
            BOOST_TEST(*res == tc.expected);
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
        {"",                    errc::format_error},
        {"   ",                 errc::format_error},
        {"2024",                errc::format_error},
        {"2024-05",             errc::format_error},
        {"2024/05/17",          errc::format_error},
        {"2024-05-17x",         errc::format_error},
        {"2024-05-17 BCE",      errc::format_error},
        {"2024-05-17 12:00",    errc::format_error},
        {"-2024-05-17",         errc::format_error},
        {"0000-01-01",          errc::format_error},
        {"2023-02-29",          errc::format_error},
        {"2024-13-01",          errc::format_error},
        {"2024-00-01",          errc::format_error},
        {"4714-01-01 BC",       errc::format_error},
        {"5874898-01-01",       errc::format_error},
        {"99999999999-01-01",   errc::overflow    },
        {"2024-99999999999-01", errc::overflow    },
    };

    for (const auto& tc : test_cases)
    {
        BOOST_TEST_CONTEXT(tc.input)
        {
            auto res = date::parse(tc.input);
            BOOST_TEST_REQUIRE(res.has_error());
            BOOST_TEST(res.error() == tc.expected);
        }
    }
}

BOOST_AUTO_TEST_CASE(parse_to_string_roundtrip)
{
    date values[] = {date::min(), date(-1, 2, 29), date(1, 1, 1), date(2024, 5, 17), date::max()};
    for (const auto& d : values)
    {
        BOOST_TEST_CONTEXT(d.days_since_era())
        {
            auto res = date::parse(d.to_string());
            BOOST_TEST_REQUIRE(res.has_value());
            BOOST_TEST(*res == d);
        }
    }
}

BOOST_AUTO_TEST_CASE(operators_relational)
{
    BOOST_TEST(date(2024, 5, 17) == date(2024, 5, 17));
    BOOST_TEST(date(2024, 5, 17) != date(2024, 5, 18));
    BOOST_TEST(date(2024, 5, 17) < date(2024, 5, 18));
    BOOST_TEST(date(-1, 5, 17) < date(1, 5, 17));
    BOOST_TEST(date(2024, 5, 17) <= date(2024, 5, 17));
    BOOST_TEST(date(2025, 1, 1) > date(2024, 12, 31));
    BOOST_TEST(date(2025, 1, 1) >= date(2024, 12, 31));
}

BOOST_AUTO_TEST_CASE(operator_stream)
{
    std::ostringstream oss;
    oss << date(-44, 3, 15);
    BOOST_TEST(oss.str() == "0044-03-15 BC");
}

BOOST_AUTO_TEST_SUITE_END()

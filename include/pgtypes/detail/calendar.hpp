//
// Copyright (c) 2019-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGTYPES_DETAIL_CALENDAR_HPP
#define PGTYPES_DETAIL_CALENDAR_HPP

// All these algorithms have been taken from:
// http://howardhinnant.github.io/date_algorithms.html
// Years are astronomical here (1 BC == 0, 2 BC == -1).

#include <boost/config.hpp>

#include <cstdint>

namespace pgtypes {
namespace detail {

// Range of PostgreSQL's date type, in astronomical years
constexpr std::int32_t min_astronomical_year = -4712;  // 4713 BC
constexpr std::int32_t max_astronomical_year = 5874897;
constexpr unsigned max_month = 12u;
constexpr unsigned max_day = 31u;

// Days between 0001-01-01 and 1970-01-01
constexpr std::int64_t era_to_epoch_days = 719162;

struct year_month_day
{
    std::int32_t year;  // astronomical
    unsigned month;
    unsigned day;
};

constexpr bool is_leap(std::int32_t y) noexcept { return y % 4 == 0 && (y % 100 != 0 || y % 400 == 0); }

BOOST_CXX14_CONSTEXPR inline unsigned last_month_day(std::int32_t y, unsigned m) noexcept
{
    constexpr unsigned char a[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return m != 2 || !is_leap(y) ? a[m - 1] : 29u;
}

BOOST_CXX14_CONSTEXPR inline bool is_valid(std::int32_t y, unsigned m, unsigned d) noexcept
{
    return y >= min_astronomical_year && y <= max_astronomical_year && m > 0 && m <= max_month && d > 0 &&
           d <= last_month_day(y, m);
}

// Days since 1970-01-01. Requires is_valid(y, m, d)
BOOST_CXX14_CONSTEXPR inline std::int64_t ymd_to_days(std::int32_t year, unsigned month, unsigned day) noexcept
{
    std::int64_t y = year;
    const std::int64_t m = month;
    const std::int64_t d = day;
    y -= m <= 2;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const std::int64_t yoe = y - era * 400;                                 // [0, 399]
    const std::int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;  // [0, 365]
    const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;         // [0, 146096]
    return era * 146097 + doe - 719468;
}

BOOST_CXX14_CONSTEXPR inline year_month_day days_to_ymd(std::int64_t num_days) noexcept
{
    num_days += 719468;
    const std::int64_t era = (num_days >= 0 ? num_days : num_days - 146096) / 146097;
    const std::int64_t doe = num_days - era * 146097;                              // [0, 146096]
    const std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;  // [0, 399]
    const std::int64_t y = yoe + era * 400;
    const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);  // [0, 365]
    const std::int64_t mp = (5 * doy + 2) / 153;                       // [0, 11]
    const std::int64_t d = doy - (153 * mp + 2) / 5 + 1;               // [1, 31]
    const std::int64_t m = mp < 10 ? mp + 3 : mp - 9;                  // [1, 12]
    return year_month_day{
        static_cast<std::int32_t>(y + (m <= 2)),
        static_cast<unsigned>(m),
        static_cast<unsigned>(d),
    };
}

// Conversions between the public year numbering (no year 0, negative is BC)
// and astronomical years
constexpr std::int32_t to_astronomical_year(std::int32_t year) noexcept { return year > 0 ? year : year + 1; }
constexpr std::int32_t from_astronomical_year(std::int32_t year) noexcept { return year > 0 ? year : year - 1; }

// Division rounding towards minus infinity, and its remainder (always positive for b > 0)
constexpr std::int64_t floor_div(std::int64_t a, std::int64_t b) noexcept
{
    return (a % b != 0 && (a < 0) != (b < 0)) ? a / b - 1 : a / b;
}

constexpr std::int64_t floor_mod(std::int64_t a, std::int64_t b) noexcept
{
    return (a % b != 0 && (a < 0) != (b < 0)) ? a % b + b : a % b;
}

constexpr std::int64_t min_days_since_era = -1721388;  // 4713-01-01 BC
constexpr std::int64_t max_days_since_era = 2145762067;  // 5874897-12-31

}  // namespace detail
}  // namespace pgtypes

#endif

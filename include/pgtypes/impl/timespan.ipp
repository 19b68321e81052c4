//
// Copyright (c) 2019-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGTYPES_IMPL_TIMESPAN_IPP
#define PGTYPES_IMPL_TIMESPAN_IPP

#pragma once

#include <pgtypes/errc.hpp>
#include <pgtypes/timespan.hpp>

#include <pgtypes/detail/text_parsing.hpp>

#include <boost/assert.hpp>
#include <boost/throw_exception.hpp>

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>

namespace pgtypes {
namespace detail {

PGTYPES_STATIC_OR_INLINE timespan millis_interval(double value, double millis_per_unit, const char* fn)
{
    constexpr double max_millis = static_cast<double>((std::numeric_limits<std::int64_t>::max)() /
                                                      ticks_per_millisecond);

    if (std::isnan(value))
        BOOST_THROW_EXCEPTION(std::invalid_argument(std::string(fn) + ": value is NaN"));

    // Round half away from zero, to the nearest millisecond
    double millis = value * millis_per_unit + (value >= 0 ? 0.5 : -0.5);
    if (millis > max_millis || millis < -max_millis)
        BOOST_THROW_EXCEPTION(std::out_of_range(std::string(fn) + ": value out of range"));

    return timespan(static_cast<std::int64_t>(millis) * ticks_per_millisecond);
}

// ss.fffffff fraction: between 1 and 7 digits, right-padded with zeroes
PGTYPES_STATIC_OR_INLINE parse_errc parse_fraction(const char*& it, const char* end, std::int64_t& output)
{
    constexpr std::size_t max_fraction_digits = 7;
    const char* first = it;
    while (it != end && is_digit(*it))
        ++it;
    auto num_digits = static_cast<std::size_t>(it - first);
    if (num_digits == 0u)
        return parse_errc::format_error;
    if (num_digits > max_fraction_digits)
        return parse_errc::overflow;

    char buff[max_fraction_digits] = {'0', '0', '0', '0', '0', '0', '0'};
    std::memcpy(buff, first, num_digits);
    const char* buff_it = buff;
    return parse_digits(buff_it, buff + max_fraction_digits, output);
}

}  // namespace detail
}  // namespace pgtypes

pgtypes::timespan pgtypes::from_days(double value)
{
    return detail::millis_interval(value, 86400000.0, "from_days");
}

pgtypes::timespan pgtypes::from_hours(double value)
{
    return detail::millis_interval(value, 3600000.0, "from_hours");
}

pgtypes::timespan pgtypes::from_minutes(double value)
{
    return detail::millis_interval(value, 60000.0, "from_minutes");
}

pgtypes::timespan pgtypes::from_seconds(double value)
{
    return detail::millis_interval(value, 1000.0, "from_seconds");
}

pgtypes::timespan pgtypes::from_milliseconds(double value)
{
    return detail::millis_interval(value, 1.0, "from_milliseconds");
}

std::string pgtypes::timespan_to_string(timespan value)
{
    // Work with the magnitude as unsigned, so the minimum value doesn't overflow
    std::int64_t count = value.count();
    bool is_negative = count < 0;
    std::uint64_t magnitude = is_negative ? 0u - static_cast<std::uint64_t>(count)
                                          : static_cast<std::uint64_t>(count);

    auto num_days = magnitude / static_cast<std::uint64_t>(ticks_per_day);
    auto rem = magnitude % static_cast<std::uint64_t>(ticks_per_day);
    auto num_hours = rem / ticks_per_hour;
    rem %= ticks_per_hour;
    auto num_minutes = rem / ticks_per_minute;
    rem %= ticks_per_minute;
    auto num_seconds = rem / ticks_per_second;
    auto fraction = rem % ticks_per_second;

    // Worst-case output is 38 chars, extra space just in case
    char buff[64]{};
    int offset = 0;
    if (is_negative)
        buff[offset++] = '-';
    if (num_days)
    {
        offset += std::snprintf(
            buff + offset,
            sizeof(buff) - offset,
            "%llu.",
            static_cast<unsigned long long>(num_days)
        );
    }
    offset += std::snprintf(
        buff + offset,
        sizeof(buff) - offset,
        "%02u:%02u:%02u",
        static_cast<unsigned>(num_hours),
        static_cast<unsigned>(num_minutes),
        static_cast<unsigned>(num_seconds)
    );
    if (fraction)
    {
        offset += std::snprintf(buff + offset, sizeof(buff) - offset, ".%07u", static_cast<unsigned>(fraction));
    }
    BOOST_ASSERT(offset > 0 && static_cast<std::size_t>(offset) < sizeof(buff));
    return std::string(buff, static_cast<std::size_t>(offset));
}

boost::system::result<pgtypes::timespan> pgtypes::parse_timespan(string_view from)
{
    using detail::parse_digits;
    using detail::parse_errc;

    from = detail::trim(from);
    const char* it = from.data();
    const char* end = it + from.size();

    // Sign
    bool is_negative = it != end && *it == '-';
    if (is_negative)
        ++it;

    // Leading number: days or hours, depending on what follows
    std::uint64_t first_number = 0;
    auto err = parse_digits(it, end, first_number);
    if (err != parse_errc::ok)
        return detail::to_error_code(err);

    std::uint64_t num_days = 0, num_hours = 0, num_minutes = 0, num_seconds = 0;
    std::int64_t fraction = 0;

    if (it == end)
    {
        // Days only
        num_days = first_number;
    }
    else
    {
        if (*it == '.')
        {
            num_days = first_number;
            ++it;
            err = parse_digits(it, end, num_hours);
            if (err != parse_errc::ok)
                return detail::to_error_code(err);
        }
        else
        {
            num_hours = first_number;
        }

        // Minutes are mandatory
        if (it == end || *it++ != ':')
            return make_error_code(errc::format_error);
        err = parse_digits(it, end, num_minutes);
        if (err != parse_errc::ok)
            return detail::to_error_code(err);

        // Seconds and fraction are optional
        if (it != end)
        {
            if (*it++ != ':')
                return make_error_code(errc::format_error);
            err = parse_digits(it, end, num_seconds);
            if (err != parse_errc::ok)
                return detail::to_error_code(err);
            if (it != end)
            {
                if (*it++ != '.')
                    return make_error_code(errc::format_error);
                err = detail::parse_fraction(it, end, fraction);
                if (err != parse_errc::ok)
                    return detail::to_error_code(err);
            }
        }

        if (it != end)
            return make_error_code(errc::format_error);
    }

    // Range checks
    if (num_hours > 23u || num_minutes > 59u || num_seconds > 59u)
        return make_error_code(errc::overflow);

    const std::uint64_t max_ticks = static_cast<std::uint64_t>((std::numeric_limits<std::int64_t>::max)());
    std::uint64_t time_ticks = num_hours * ticks_per_hour + num_minutes * ticks_per_minute +
                               num_seconds * ticks_per_second + static_cast<std::uint64_t>(fraction);
    if (num_days > (max_ticks - time_ticks) / static_cast<std::uint64_t>(ticks_per_day))
        return make_error_code(errc::overflow);

    auto total = static_cast<std::int64_t>(num_days * ticks_per_day + time_ticks);
    return timespan(is_negative ? -total : total);
}

#endif

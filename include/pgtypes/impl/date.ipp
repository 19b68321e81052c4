//
// Copyright (c) 2019-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGTYPES_IMPL_DATE_IPP
#define PGTYPES_IMPL_DATE_IPP

#pragma once

#include <pgtypes/date.hpp>
#include <pgtypes/errc.hpp>

#include <pgtypes/detail/calendar.hpp>
#include <pgtypes/detail/text_parsing.hpp>

#include <boost/assert.hpp>
#include <boost/throw_exception.hpp>

#include <cstdint>
#include <cstdio>
#include <ostream>
#include <stdexcept>

namespace pgtypes {
namespace detail {

PGTYPES_STATIC_OR_INLINE parse_errc parse_era(const char*& it, const char* end, bool& is_bc)
{
    is_bc = false;
    if (it == end)
        return parse_errc::ok;

    // Era markers must be separated from the date by whitespace
    if (!is_space(*it))
        return parse_errc::format_error;
    while (it != end && is_space(*it))
        ++it;

    string_view marker(it, static_cast<std::size_t>(end - it));
    if (iequals_ascii(marker, "bc"))
        is_bc = true;
    else if (!iequals_ascii(marker, "ad"))
        return parse_errc::format_error;
    it = end;
    return parse_errc::ok;
}

}  // namespace detail
}  // namespace pgtypes

pgtypes::date::date(std::int32_t year, unsigned month, unsigned day)
{
    auto y = detail::to_astronomical_year(year);
    if (year == 0 || !detail::is_valid(y, month, day))
        BOOST_THROW_EXCEPTION(std::out_of_range("date::date: invalid date"));
    days_ = static_cast<std::int32_t>(detail::ymd_to_days(y, month, day) + detail::era_to_epoch_days);
}

pgtypes::date pgtypes::date::from_days_since_era(std::int64_t days)
{
    if (days < detail::min_days_since_era || days > detail::max_days_since_era)
        BOOST_THROW_EXCEPTION(std::out_of_range("date::from_days_since_era: date out of range"));
    return date(days, unchecked_tag{});
}

pgtypes::date pgtypes::date::add_days(std::int64_t value) const
{
    // Any value beyond this would be out of range anyway
    constexpr std::int64_t max_delta = detail::max_days_since_era - detail::min_days_since_era;
    if (value > max_delta || value < -max_delta)
        BOOST_THROW_EXCEPTION(std::out_of_range("date::add_days: date out of range"));
    return from_days_since_era(days_ + value);
}

pgtypes::date pgtypes::date::add_months(std::int64_t value) const
{
    constexpr std::int64_t max_delta = static_cast<std::int64_t>(detail::max_astronomical_year -
                                                                 detail::min_astronomical_year + 1) *
                                       12;
    if (value > max_delta || value < -max_delta)
        BOOST_THROW_EXCEPTION(std::out_of_range("date::add_months: date out of range"));

    auto current = ymd();
    std::int64_t total = static_cast<std::int64_t>(current.year) * 12 + (current.month - 1) + value;
    std::int64_t new_year = detail::floor_div(total, 12);
    auto new_month = static_cast<unsigned>(total - new_year * 12 + 1);
    if (new_year < detail::min_astronomical_year || new_year > detail::max_astronomical_year)
        BOOST_THROW_EXCEPTION(std::out_of_range("date::add_months: date out of range"));

    auto y = static_cast<std::int32_t>(new_year);
    auto last_day = detail::last_month_day(y, new_month);
    auto new_day = current.day > last_day ? last_day : current.day;
    return date(detail::ymd_to_days(y, new_month, new_day) + detail::era_to_epoch_days, unchecked_tag{});
}

pgtypes::date pgtypes::date::add_years(std::int64_t value) const
{
    constexpr std::int64_t max_delta = static_cast<std::int64_t>(detail::max_astronomical_year) -
                                       detail::min_astronomical_year;
    if (value > max_delta || value < -max_delta)
        BOOST_THROW_EXCEPTION(std::out_of_range("date::add_years: date out of range"));
    return add_months(value * 12);
}

std::string pgtypes::date::to_string() const
{
    auto v = ymd();
    bool is_bc = v.year <= 0;
    auto display_year = is_bc ? static_cast<std::uint32_t>(1 - static_cast<std::int64_t>(v.year))
                              : static_cast<std::uint32_t>(v.year);

    // Worst-case output is 17 chars, extra space just in case
    char buffer[32]{};
    int res = std::snprintf(
        buffer,
        sizeof(buffer),
        "%04u-%02u-%02u%s",
        static_cast<unsigned>(display_year),
        v.month,
        v.day,
        is_bc ? " BC" : ""
    );
    BOOST_ASSERT(res > 0);
    return std::string(buffer, static_cast<std::size_t>(res));
}

boost::system::result<pgtypes::date> pgtypes::date::parse(string_view from)
{
    using detail::parse_digits;
    using detail::parse_errc;

    from = detail::trim(from);
    const char* it = from.data();
    const char* end = it + from.size();

    std::int32_t year = 0;
    unsigned month = 0, day = 0;
    bool is_bc = false;

    auto err = parse_digits(it, end, year);
    if (err != parse_errc::ok)
        return detail::to_error_code(err);
    if (it == end || *it++ != '-')
        return make_error_code(errc::format_error);
    err = parse_digits(it, end, month);
    if (err != parse_errc::ok)
        return detail::to_error_code(err);
    if (it == end || *it++ != '-')
        return make_error_code(errc::format_error);
    err = parse_digits(it, end, day);
    if (err != parse_errc::ok)
        return detail::to_error_code(err);
    err = detail::parse_era(it, end, is_bc);
    if (err != parse_errc::ok)
        return detail::to_error_code(err);

    // There is no year zero, either AD or BC
    if (year == 0)
        return make_error_code(errc::format_error);
    auto y = detail::to_astronomical_year(is_bc ? -year : year);
    if (!detail::is_valid(y, month, day))
        return make_error_code(errc::format_error);

    return date(detail::ymd_to_days(y, month, day) + detail::era_to_epoch_days, unchecked_tag{});
}

std::ostream& pgtypes::operator<<(std::ostream& os, const date& v) { return os << v.to_string(); }

#endif

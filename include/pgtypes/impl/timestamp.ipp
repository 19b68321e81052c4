//
// Copyright (c) 2019-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGTYPES_IMPL_TIMESTAMP_IPP
#define PGTYPES_IMPL_TIMESTAMP_IPP

#pragma once

#include <pgtypes/errc.hpp>
#include <pgtypes/timestamp.hpp>

#include <pgtypes/detail/calendar.hpp>
#include <pgtypes/detail/local_offset.hpp>
#include <pgtypes/detail/text_parsing.hpp>

#include <boost/throw_exception.hpp>

#include <cstdint>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <string>

namespace pgtypes {
namespace detail {

// 0001-01-01 and 9999-12-31, the range of std::chrono::system_clock time points we produce
constexpr std::int64_t min_time_point_days = 0;
constexpr std::int64_t max_time_point_days = 3652058;

PGTYPES_STATIC_OR_INLINE bool checked_add(std::int64_t a, std::int64_t b, std::int64_t& output) noexcept
{
    constexpr auto max_value = (std::numeric_limits<std::int64_t>::max)();
    constexpr auto min_value = (std::numeric_limits<std::int64_t>::min)();
    if ((b > 0 && a > max_value - b) || (b < 0 && a < min_value - b))
        return false;
    output = a + b;
    return true;
}

PGTYPES_STATIC_OR_INLINE bool checked_sub(std::int64_t a, std::int64_t b, std::int64_t& output) noexcept
{
    constexpr auto max_value = (std::numeric_limits<std::int64_t>::max)();
    constexpr auto min_value = (std::numeric_limits<std::int64_t>::min)();
    if ((b < 0 && a > max_value + b) || (b > 0 && a < min_value + b))
        return false;
    output = a - b;
    return true;
}

// days * ticks_per_day, if it fits
PGTYPES_STATIC_OR_INLINE bool days_to_ticks(std::int64_t days, std::int64_t& output) noexcept
{
    constexpr auto max_days = (std::numeric_limits<std::int64_t>::max)() / ticks_per_day;
    constexpr auto min_days = (std::numeric_limits<std::int64_t>::min)() / ticks_per_day;
    if (days > max_days || days < min_days)
        return false;
    output = days * ticks_per_day;
    return true;
}

// Builds a finite timestamp from a day count since the era and a normalized time of day
PGTYPES_STATIC_OR_INLINE timestamp make_finite(std::int64_t days, std::int64_t tod, timestamp_kind kind)
{
    BOOST_ASSERT(tod >= 0 && tod < ticks_per_day);
    return timestamp(date::from_days_since_era(days), timespan(tod), kind);
}

// Used to order the variant alternatives: -infinity < finite < infinity
PGTYPES_STATIC_OR_INLINE int rank(const timestamp& v) noexcept
{
    if (v.is_negative_infinity())
        return 0;
    return v.is_finite() ? 1 : 2;
}

template <class T>
int three_way(const T& lhs, const T& rhs) noexcept
{
    return lhs < rhs ? -1 : (rhs < lhs ? 1 : 0);
}

}  // namespace detail
}  // namespace pgtypes

pgtypes::timestamp::timestamp(
    std::int32_t year,
    unsigned month,
    unsigned day,
    unsigned hour,
    unsigned minute,
    unsigned second,
    timestamp_kind kind
)
    : timestamp(year, month, day, hour, minute, second, 0u, kind)
{
}

pgtypes::timestamp::timestamp(
    std::int32_t year,
    unsigned month,
    unsigned day,
    unsigned hour,
    unsigned minute,
    unsigned second,
    unsigned millisecond,
    timestamp_kind kind
)
{
    if (hour > 23u || minute > 59u || second > 59u || millisecond > 999u)
        BOOST_THROW_EXCEPTION(std::out_of_range("timestamp::timestamp: invalid time of day"));
    auto tod = hour * ticks_per_hour + minute * ticks_per_minute + second * ticks_per_second +
               millisecond * ticks_per_millisecond;
    impl_ = finite_value{pgtypes::date(year, month, day), timespan(tod), kind};
}

pgtypes::timestamp::timestamp(std::int64_t ticks, timestamp_kind kind)
    : timestamp(detail::make_finite(
          detail::floor_div(ticks, ticks_per_day),
          detail::floor_mod(ticks, ticks_per_day),
          kind
      ))
{
}

pgtypes::timestamp::timestamp(time_point tp, timestamp_kind kind)
    : timestamp(detail::make_finite(
          detail::floor_div(tp.time_since_epoch().count(), ticks_per_day) + detail::era_to_epoch_days,
          detail::floor_mod(tp.time_since_epoch().count(), ticks_per_day),
          kind
      ))
{
}

pgtypes::timestamp pgtypes::timestamp::now()
{
    auto sys_now = std::chrono::system_clock::now();
    auto offset = detail::utc_offset_at(std::chrono::system_clock::to_time_t(sys_now), true);
    if (offset.has_error())
        BOOST_THROW_EXCEPTION(std::runtime_error("timestamp::now: can't get the host's UTC offset"));
    auto tp = std::chrono::time_point_cast<timespan>(sys_now);
    return timestamp(tp, timestamp_kind::utc).to_local_time(*offset);
}

std::int64_t pgtypes::timestamp::ticks() const
{
    const auto& f = finite();
    std::int64_t res = 0;
    if (!detail::days_to_ticks(f.date.days_since_era(), res) ||
        !detail::checked_add(res, f.time_of_day.count(), res))
    {
        BOOST_THROW_EXCEPTION(std::out_of_range("timestamp::ticks: value out of range"));
    }
    return res;
}

boost::system::result<pgtypes::timestamp::time_point> pgtypes::timestamp::as_time_point() const
{
    auto* f = if_finite();
    if (!f)
        return make_error_code(errc::invalid_cast);

    // Normalize without throwing, then check the system_clock range
    auto tod = f->time_of_day.count();
    std::int64_t days = f->date.days_since_era() + detail::floor_div(tod, ticks_per_day);
    if (days < detail::min_time_point_days || days > detail::max_time_point_days)
        return make_error_code(errc::invalid_cast);

    auto epoch_days = days - detail::era_to_epoch_days;
    return time_point(timespan(epoch_days * ticks_per_day + detail::floor_mod(tod, ticks_per_day)));
}

pgtypes::timestamp pgtypes::timestamp::to_universal_time() const
{
    // Sentinels and UTC values don't need the host's offset
    if (kind() == timestamp_kind::utc || !is_finite())
        return *this;
    return to_universal_time(detail::local_utc_offset());
}

pgtypes::timestamp pgtypes::timestamp::to_universal_time(timespan offset) const
{
    auto* f = if_finite();
    if (!f || f->kind == timestamp_kind::utc)
        return *this;
    auto res = subtract(offset);
    return timestamp(res.date(), res.time_of_day(), timestamp_kind::utc);
}

pgtypes::timestamp pgtypes::timestamp::to_local_time() const
{
    if (kind() == timestamp_kind::local || !is_finite())
        return *this;
    return to_local_time(detail::local_utc_offset());
}

pgtypes::timestamp pgtypes::timestamp::to_local_time(timespan offset) const
{
    auto* f = if_finite();
    if (!f || f->kind == timestamp_kind::local)
        return *this;
    auto res = add(offset);
    return timestamp(res.date(), res.time_of_day(), timestamp_kind::local);
}

pgtypes::timestamp pgtypes::timestamp::add_ticks(std::int64_t value) const
{
    auto* f = if_finite();
    if (!f)
        return *this;

    // Split both operands into days and a positive sub-day remainder, so nothing overflows
    auto tod = f->time_of_day.count();
    std::int64_t days = f->date.days_since_era() + detail::floor_div(tod, ticks_per_day) +
                        detail::floor_div(value, ticks_per_day);
    std::int64_t rem = detail::floor_mod(tod, ticks_per_day) + detail::floor_mod(value, ticks_per_day);
    days += rem / ticks_per_day;
    rem %= ticks_per_day;
    return detail::make_finite(days, rem, f->kind);
}

pgtypes::timestamp pgtypes::timestamp::add_months(std::int64_t value) const
{
    auto* f = if_finite();
    if (!f)
        return *this;
    return timestamp(f->date.add_months(value), f->time_of_day, f->kind);
}

pgtypes::timestamp pgtypes::timestamp::add_years(std::int64_t value) const
{
    auto* f = if_finite();
    if (!f)
        return *this;
    return timestamp(f->date.add_years(value), f->time_of_day, f->kind);
}

pgtypes::timestamp pgtypes::timestamp::subtract(timespan value) const
{
    if (!is_finite())
        return *this;
    if (value == (timespan::min)())
        BOOST_THROW_EXCEPTION(std::out_of_range("timestamp::subtract: value out of range"));
    return add(-value);
}

boost::system::result<pgtypes::timespan> pgtypes::timestamp::subtract(const timestamp& other) const
{
    auto* lhs = if_finite();
    auto* rhs = other.if_finite();
    if (!lhs || !rhs)
        return make_error_code(errc::invalid_operation);

    std::int64_t day_diff = static_cast<std::int64_t>(lhs->date.days_since_era()) - rhs->date.days_since_era();
    std::int64_t day_ticks = 0, tod_diff = 0, res = 0;
    if (!detail::days_to_ticks(day_diff, day_ticks) ||
        !detail::checked_sub(lhs->time_of_day.count(), rhs->time_of_day.count(), tod_diff) ||
        !detail::checked_add(day_ticks, tod_diff, res))
    {
        return make_error_code(errc::overflow);
    }
    return timespan(res);
}

int pgtypes::timestamp::compare(const timestamp& other) const noexcept
{
    int lhs_rank = detail::rank(*this), rhs_rank = detail::rank(other);
    if (lhs_rank != rhs_rank)
        return lhs_rank < rhs_rank ? -1 : 1;
    auto* lhs = if_finite();
    if (!lhs)
        return 0;
    auto* rhs = other.if_finite();
    int res = detail::three_way(lhs->date, rhs->date);
    return res != 0 ? res : detail::three_way(lhs->time_of_day, rhs->time_of_day);
}

bool pgtypes::timestamp::operator==(const timestamp& rhs) const noexcept
{
    if (impl_.index() != rhs.impl_.index())
        return false;
    auto* lhs_f = if_finite();
    if (!lhs_f)
        return true;
    auto* rhs_f = rhs.if_finite();
    return lhs_f->date == rhs_f->date && lhs_f->time_of_day == rhs_f->time_of_day;
}

std::string pgtypes::timestamp::to_string() const
{
    auto* f = if_finite();
    if (f)
    {
        std::string res = f->date.to_string();
        res += ' ';
        res += timespan_to_string(f->time_of_day);
        return res;
    }
    return is_infinity() ? "infinity" : "-infinity";
}

boost::system::result<pgtypes::timestamp> pgtypes::timestamp::parse(string_view from)
{
    std::string str = detail::to_lower_ascii(detail::trim(from));
    if (str == "infinity")
        return infinity();
    if (str == "-infinity")
        return negative_infinity();

    // Date part: up to the first space
    auto idx_space = str.find(' ');
    if (idx_space == std::string::npos)
        return make_error_code(errc::format_error);
    std::string date_part = str.substr(0, idx_space);

    // Rest: the time, plus an optional era marker anywhere. Tokens after the time are ignored
    string_view time_part;
    bool is_bc = false;
    const char* it = str.data() + idx_space;
    const char* end = str.data() + str.size();
    while (it != end)
    {
        while (it != end && detail::is_space(*it))
            ++it;
        const char* token_first = it;
        while (it != end && !detail::is_space(*it))
            ++it;
        string_view token(token_first, static_cast<std::size_t>(it - token_first));
        if (token.empty())
            break;
        if (token == "bc")
            is_bc = true;
        else if (token != "ad" && time_part.empty())
            time_part = token;
    }
    if (time_part.empty())
        return make_error_code(errc::format_error);

    if (is_bc)
        date_part += " bc";
    auto d = pgtypes::date::parse(date_part);
    if (d.has_error())
        return d.error();
    auto tod = parse_timespan(time_part);
    if (tod.has_error())
        return tod.error();
    return timestamp(*d, *tod);
}

boost::system::result<pgtypes::timestamp> pgtypes::timestamp::parse(const char* from)
{
    if (from == nullptr)
        return make_error_code(errc::null_argument);
    return parse(string_view(from));
}

std::ostream& pgtypes::operator<<(std::ostream& os, const timestamp& v) { return os << v.to_string(); }

std::ostream& pgtypes::operator<<(std::ostream& os, timestamp_kind v)
{
    switch (v)
    {
    case timestamp_kind::unspecified: return os << "unspecified";
    case timestamp_kind::utc: return os << "utc";
    case timestamp_kind::local: return os << "local";
    default: return os << "<unknown timestamp_kind>";
    }
}

#endif

//
// Copyright (c) 2019-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGTYPES_TIMESPAN_HPP
#define PGTYPES_TIMESPAN_HPP

#include <pgtypes/string_view.hpp>

#include <pgtypes/detail/config.hpp>

#include <boost/system/result.hpp>

#include <chrono>
#include <cstdint>
#include <ratio>
#include <string>

namespace pgtypes {

/**
 * \brief A signed time interval, with 100-nanosecond (tick) resolution.
 * \details
 * Used as the time-of-day component of a \ref timestamp and as the operand
 * of timestamp arithmetic. Its range is about +-29227 years.
 */
using timespan = std::chrono::duration<std::int64_t, std::ratio<1, 10000000>>;

/// Number of ticks in a millisecond.
constexpr std::int64_t ticks_per_millisecond = 10000;

/// Number of ticks in a second.
constexpr std::int64_t ticks_per_second = ticks_per_millisecond * 1000;

/// Number of ticks in a minute.
constexpr std::int64_t ticks_per_minute = ticks_per_second * 60;

/// Number of ticks in an hour.
constexpr std::int64_t ticks_per_hour = ticks_per_minute * 60;

/// Number of ticks in a day.
constexpr std::int64_t ticks_per_day = ticks_per_hour * 24;

/**
 * \brief Creates a timespan from a number of whole and fractional days.
 * \details The value is rounded to the nearest millisecond.
 * \par Exception safety
 * Strong guarantee.
 * \throws std::invalid_argument If `value` is NaN.
 * \throws std::out_of_range If the result can't be represented as a \ref timespan.
 */
PGTYPES_DECL timespan from_days(double value);

/// \copydoc from_days
PGTYPES_DECL timespan from_hours(double value);

/// \copydoc from_days
PGTYPES_DECL timespan from_minutes(double value);

/// \copydoc from_days
PGTYPES_DECL timespan from_seconds(double value);

/// \copydoc from_days
PGTYPES_DECL timespan from_milliseconds(double value);

/**
 * \brief Formats a timespan as `[-][d.]hh:mm:ss[.fffffff]`.
 * \details The fractional part is only rendered when non-zero.
 */
PGTYPES_DECL std::string timespan_to_string(timespan value);

/**
 * \brief Parses a timespan.
 * \details
 * Accepts `[-][d.]hh:mm[:ss[.f]]`, where the fraction has between 1 and 7 digits, or `[-]d`.
 * Leading and trailing whitespace is ignored.
 * \n
 * Returns \ref errc::format_error if the text is not recognized, and \ref errc::overflow
 * if the text is well-formed but a component is out of range (e.g. `25:00`).
 */
PGTYPES_DECL boost::system::result<timespan> parse_timespan(string_view from);

}  // namespace pgtypes

#ifdef PGTYPES_HEADER_ONLY
#include <pgtypes/impl/timespan.ipp>
#endif

#endif

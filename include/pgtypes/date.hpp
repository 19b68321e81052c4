//
// Copyright (c) 2019-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGTYPES_DATE_HPP
#define PGTYPES_DATE_HPP

#include <pgtypes/string_view.hpp>

#include <pgtypes/detail/calendar.hpp>
#include <pgtypes/detail/config.hpp>

#include <boost/config.hpp>
#include <boost/system/result.hpp>

#include <cstdint>
#include <iosfwd>
#include <string>

namespace pgtypes {

/// Day of the week, as returned by \ref date::day_of_week.
enum class weekday
{
    sunday = 0,
    monday,
    tuesday,
    wednesday,
    thursday,
    friday,
    saturday,
};

/**
 * \brief Type representing a PostgreSQL `DATE` value.
 * \details
 * Represents a day in the proleptic Gregorian calendar, without a time zone. Stored as
 * the number of days since the era (0001-01-01 AD, day zero).
 * \n
 * The representable range is PostgreSQL's: from 4713-01-01 BC to 5874897-12-31 AD.
 * Years are numbered as PostgreSQL displays them: positive years are AD,
 * negative years are BC (-1 is 1 BC), and there is no year zero.
 * \n
 * Objects of this type always hold a valid date.
 */
class date
{
public:
    /**
     * \brief Constructs the era start date (0001-01-01).
     * \par Exception safety
     * No-throw guarantee.
     */
    constexpr date() noexcept = default;

    /**
     * \brief Constructs a date from its year, month and day components.
     * \par Exception safety
     * Strong guarantee.
     * \throws std::out_of_range If the components don't identify a valid date within
     * the representable range (e.g. `date(2019, 2, 29)` or `date(0, 1, 1)`).
     */
    PGTYPES_DECL date(std::int32_t year, unsigned month, unsigned day);

    /**
     * \brief Constructs a date from a number of days since the era.
     * \par Exception safety
     * Strong guarantee.
     * \throws std::out_of_range If the resulting date is out of the representable range.
     */
    PGTYPES_DECL static date from_days_since_era(std::int64_t days);

    /// The Unix epoch, 1970-01-01.
    static constexpr date epoch() noexcept { return date(detail::era_to_epoch_days, unchecked_tag{}); }

    /// The era start, 0001-01-01.
    static constexpr date era() noexcept { return date(); }

    /// The minimum representable date, 4713-01-01 BC.
    static constexpr date min() noexcept { return date(detail::min_days_since_era, unchecked_tag{}); }

    /// The maximum representable date, 5874897-12-31.
    static constexpr date max() noexcept { return date(detail::max_days_since_era, unchecked_tag{}); }

    /// Retrieves the year. Negative for BC dates; never zero.
    BOOST_CXX14_CONSTEXPR std::int32_t year() const noexcept
    {
        return detail::from_astronomical_year(ymd().year);
    }

    /// Retrieves the month (1-based).
    BOOST_CXX14_CONSTEXPR unsigned month() const noexcept { return ymd().month; }

    /// Retrieves the day of the month (1-based).
    BOOST_CXX14_CONSTEXPR unsigned day() const noexcept { return ymd().day; }

    /// Retrieves the day of the year, in the `[1, 366]` range.
    BOOST_CXX14_CONSTEXPR unsigned day_of_year() const noexcept
    {
        auto first_day = detail::ymd_to_days(ymd().year, 1u, 1u) + detail::era_to_epoch_days;
        return static_cast<unsigned>(days_ - first_day + 1);
    }

    /// Retrieves the day of the week.
    BOOST_CXX14_CONSTEXPR weekday day_of_week() const noexcept
    {
        // 0001-01-01 was a Monday
        auto rem = (days_ % 7 + 7) % 7;
        return static_cast<weekday>((rem + 1) % 7);
    }

    /// Returns whether this date's year is a leap year.
    BOOST_CXX14_CONSTEXPR bool is_leap_year() const noexcept { return detail::is_leap(ymd().year); }

    /// Retrieves the number of days since 0001-01-01. Negative for BC dates.
    constexpr std::int32_t days_since_era() const noexcept { return days_; }

    /**
     * \brief Adds a number of days.
     * \throws std::out_of_range If the result is out of the representable range.
     */
    PGTYPES_DECL date add_days(std::int64_t value) const;

    /**
     * \brief Adds a number of months.
     * \details If the resulting month is shorter than the current day, the day
     * is clamped to the last day of the month (e.g. Jan 31 + 1 month = Feb 28).
     * \throws std::out_of_range If the result is out of the representable range.
     */
    PGTYPES_DECL date add_months(std::int64_t value) const;

    /**
     * \brief Adds a number of years.
     * \details Feb 29 becomes Feb 28 when the target year is not a leap year.
     * Adding years to a BC date skips year zero.
     * \throws std::out_of_range If the result is out of the representable range.
     */
    PGTYPES_DECL date add_years(std::int64_t value) const;

    /// Formats the date as `yyyy-MM-dd`, with a trailing ` BC` for BC dates.
    PGTYPES_DECL std::string to_string() const;

    /**
     * \brief Parses a date in `yyyy-MM-dd[ BC]` format.
     * \details
     * The era marker is case-insensitive, and may also be ` AD`. Leading and trailing
     * whitespace is ignored.
     * \n
     * Returns \ref errc::overflow if a numeric field doesn't fit in its integer type,
     * and \ref errc::format_error for any other failure, including calendar dates that
     * don't exist or are out of the representable range.
     */
    PGTYPES_DECL static boost::system::result<date> parse(string_view from);

    /// Tests for equality.
    constexpr bool operator==(const date& rhs) const noexcept { return days_ == rhs.days_; }

    /// Tests for inequality.
    constexpr bool operator!=(const date& rhs) const noexcept { return days_ != rhs.days_; }

    /// Ordering.
    constexpr bool operator<(const date& rhs) const noexcept { return days_ < rhs.days_; }
    constexpr bool operator<=(const date& rhs) const noexcept { return days_ <= rhs.days_; }
    constexpr bool operator>(const date& rhs) const noexcept { return days_ > rhs.days_; }
    constexpr bool operator>=(const date& rhs) const noexcept { return days_ >= rhs.days_; }

private:
    struct unchecked_tag
    {
    };

    std::int32_t days_{};

    constexpr date(std::int64_t days, unchecked_tag) noexcept : days_(static_cast<std::int32_t>(days)) {}

    BOOST_CXX14_CONSTEXPR detail::year_month_day ymd() const noexcept
    {
        return detail::days_to_ymd(days_ - detail::era_to_epoch_days);
    }
};

/**
 * \relates date
 * \brief Streams a date, using the same format as \ref date::to_string.
 */
PGTYPES_DECL
std::ostream& operator<<(std::ostream& os, const date& v);

}  // namespace pgtypes

#ifdef PGTYPES_HEADER_ONLY
#include <pgtypes/impl/date.ipp>
#endif

#endif

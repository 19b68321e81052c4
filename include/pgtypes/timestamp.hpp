//
// Copyright (c) 2019-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGTYPES_TIMESTAMP_HPP
#define PGTYPES_TIMESTAMP_HPP

#include <pgtypes/date.hpp>
#include <pgtypes/string_view.hpp>
#include <pgtypes/timespan.hpp>

#include <pgtypes/detail/config.hpp>

#include <boost/assert.hpp>
#include <boost/config.hpp>
#include <boost/container_hash/hash.hpp>
#include <boost/system/result.hpp>
#include <boost/variant2/variant.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>

namespace pgtypes {

class value_view;

/// Time zone disposition of a finite \ref timestamp.
enum class timestamp_kind
{
    /// The value is not anchored to any time zone.
    unspecified = 0,

    /// The value is a UTC time.
    utc,

    /// The value is a local time, in the host's time zone.
    local,
};

/// Tag type representing PostgreSQL's `infinity` timestamp.
struct positive_infinity_t
{
};

/// Tag type representing PostgreSQL's `-infinity` timestamp.
struct negative_infinity_t
{
};

/**
 * \brief Type representing PostgreSQL `TIMESTAMP` and `TIMESTAMPTZ` values.
 * \details
 * Holds either a finite moment (a \ref date plus a time of day and a \ref timestamp_kind),
 * or one of the `infinity` and `-infinity` sentinels. The finite range is the one of \ref date,
 * which is much wider than the one of `std::chrono::system_clock`.
 * \n
 * Objects of this type are immutable: all arithmetic and time zone conversion functions
 * return new objects.
 * \n
 * Ordering and equality ignore the kind: `infinity` is greater than any finite value,
 * `-infinity` is smaller than any finite value, and finite values compare by date,
 * then by time of day.
 */
class timestamp
{
public:
    /// The payload of a finite timestamp.
    struct finite_value
    {
        /// The day.
        pgtypes::date date;

        /**
         * \brief Offset since midnight.
         * \details Usually in the `[0, 24h)` range. Values constructed from a date and a time
         * of day may hold any offset: use \ref timestamp::normalize to bring it to the range.
         */
        timespan time_of_day;

        /// The time zone disposition.
        timestamp_kind kind;
    };

    /// The underlying sum type.
    using variant_type = boost::variant2::variant<finite_value, positive_infinity_t, negative_infinity_t>;

    /**
     * \brief A `std::chrono::time_point` with the same resolution as this class.
     * \details Can only represent the `[1, 9999]` year range.
     */
    using time_point = std::chrono::time_point<std::chrono::system_clock, timespan>;

#ifdef PGTYPES_HAS_LOCAL_TIME
    /**
     * \brief A `std::chrono::local_time` with the same resolution as this class.
     * \details Requires C++20 calendar types.
     */
    using local_time_point = std::chrono::local_time<timespan>;
#endif

    /**
     * \brief Constructs a timestamp holding the era start (0001-01-01 00:00:00, unspecified).
     * \par Exception safety
     * No-throw guarantee.
     */
    timestamp() noexcept : impl_(finite_value{pgtypes::date(), timespan(0), timestamp_kind::unspecified}) {}

    /**
     * \brief Constructs a finite timestamp from a date and a time of day.
     * \details `time_of_day` is stored as is, and may be negative or exceed a day.
     * \par Exception safety
     * No-throw guarantee.
     */
    timestamp(
        pgtypes::date d,
        timespan time_of_day = timespan(0),
        timestamp_kind kind = timestamp_kind::unspecified
    ) noexcept
        : impl_(finite_value{d, time_of_day, kind})
    {
    }

    /**
     * \brief Constructs a finite timestamp from its components.
     * \details Years follow \ref date conventions (negative years are BC).
     * \par Exception safety
     * Strong guarantee.
     * \throws std::out_of_range If any of the components is out of range.
     */
    PGTYPES_DECL timestamp(
        std::int32_t year,
        unsigned month,
        unsigned day,
        unsigned hour,
        unsigned minute,
        unsigned second,
        timestamp_kind kind = timestamp_kind::unspecified
    );

    /// \copydoc timestamp(std::int32_t,unsigned,unsigned,unsigned,unsigned,unsigned,timestamp_kind)
    PGTYPES_DECL timestamp(
        std::int32_t year,
        unsigned month,
        unsigned day,
        unsigned hour,
        unsigned minute,
        unsigned second,
        unsigned millisecond,
        timestamp_kind kind = timestamp_kind::unspecified
    );

    /**
     * \brief Constructs a finite timestamp from a number of ticks since the era.
     * \details Ticks are 100 nanosecond units, counted from 0001-01-01 00:00:00.
     * Negative counts represent moments before the era.
     * \par Exception safety
     * Strong guarantee.
     * \throws std::out_of_range If the resulting date is out of the representable range.
     */
    PGTYPES_DECL explicit timestamp(std::int64_t ticks, timestamp_kind kind = timestamp_kind::unspecified);

    /**
     * \brief Constructs a finite timestamp from a `time_point`.
     * \details `system_clock` measures UTC, so the default kind is \ref timestamp_kind::utc.
     * \par Exception safety
     * Strong guarantee.
     * \throws std::out_of_range If the resulting date is out of the representable range.
     */
    PGTYPES_DECL explicit timestamp(time_point tp, timestamp_kind kind = timestamp_kind::utc);

#ifdef PGTYPES_HAS_LOCAL_TIME
    /**
     * \brief Constructs a finite timestamp from a `local_time_point`, tagged as local.
     * \details Requires C++20 calendar types.
     */
    explicit timestamp(local_time_point tp)
        : timestamp(time_point(tp.time_since_epoch()), timestamp_kind::local)
    {
    }
#endif

    /// Constructs an `infinity` timestamp.
    timestamp(positive_infinity_t v) noexcept : impl_(v) {}

    /// Constructs a `-infinity` timestamp.
    timestamp(negative_infinity_t v) noexcept : impl_(v) {}

    /// The Unix epoch, 1970-01-01 00:00:00, unspecified.
    static timestamp epoch() noexcept { return timestamp(pgtypes::date::epoch()); }

    /// The era start, 0001-01-01 00:00:00, unspecified.
    static timestamp era() noexcept { return timestamp(pgtypes::date::era()); }

    /// PostgreSQL's `infinity`.
    static timestamp infinity() noexcept { return timestamp(positive_infinity_t()); }

    /// PostgreSQL's `-infinity`.
    static timestamp negative_infinity() noexcept { return timestamp(negative_infinity_t()); }

    /**
     * \brief Returns the current host time, as a local timestamp.
     * \details The host's offset in effect now is used, daylight saving time included.
     * This differs from \ref to_local_time(), which always applies the base UTC offset.
     * \par Exception safety
     * Strong guarantee.
     * \throws std::runtime_error If the host's UTC offset can't be determined.
     */
    PGTYPES_DECL static timestamp now();

    /// Returns the underlying variant.
    const variant_type& to_variant() const noexcept { return impl_; }

    /// Returns a pointer to the finite payload, or `nullptr` for the sentinels.
    const finite_value* if_finite() const noexcept { return boost::variant2::get_if<finite_value>(&impl_); }

    /// Returns whether `*this` is `infinity`.
    bool is_infinity() const noexcept { return impl_.index() == 1u; }

    /// Returns whether `*this` is `-infinity`.
    bool is_negative_infinity() const noexcept { return impl_.index() == 2u; }

    /// Returns whether `*this` is neither `infinity` nor `-infinity`.
    bool is_finite() const noexcept { return impl_.index() == 0u; }

    /// Returns the time zone disposition. Sentinels are always \ref timestamp_kind::unspecified.
    timestamp_kind kind() const noexcept
    {
        auto* f = if_finite();
        return f ? f->kind : timestamp_kind::unspecified;
    }

    /**
     * \brief Retrieves the date component (unchecked access).
     * \par Preconditions
     * `this->is_finite()`.
     */
    pgtypes::date date() const noexcept { return finite().date; }

    /**
     * \brief Retrieves the time of day component (unchecked access).
     * \par Preconditions
     * `this->is_finite()`.
     */
    timespan time_of_day() const noexcept { return finite().time_of_day; }

    /// Retrieves the year of the date component. Requires `this->is_finite()`.
    std::int32_t year() const noexcept { return finite().date.year(); }

    /// Retrieves the month of the date component. Requires `this->is_finite()`.
    unsigned month() const noexcept { return finite().date.month(); }

    /// Retrieves the day of the date component. Requires `this->is_finite()`.
    unsigned day() const noexcept { return finite().date.day(); }

    /// Retrieves the day of the year. Requires `this->is_finite()`.
    unsigned day_of_year() const noexcept { return finite().date.day_of_year(); }

    /// Retrieves the day of the week. Requires `this->is_finite()`.
    weekday day_of_week() const noexcept { return finite().date.day_of_week(); }

    /// Returns whether the date component is in a leap year. Requires `this->is_finite()`.
    bool is_leap_year() const noexcept { return finite().date.is_leap_year(); }

    /**
     * \brief Retrieves the hours of the time of day, in the `[-23, 23]` range.
     * \details Whole days in the time of day are discarded. Requires `this->is_finite()`.
     */
    int hour() const noexcept { return static_cast<int>(finite().time_of_day.count() / ticks_per_hour % 24); }

    /// Retrieves the minutes of the time of day. Requires `this->is_finite()`.
    int minute() const noexcept { return static_cast<int>(finite().time_of_day.count() / ticks_per_minute % 60); }

    /// Retrieves the seconds of the time of day. Requires `this->is_finite()`.
    int second() const noexcept { return static_cast<int>(finite().time_of_day.count() / ticks_per_second % 60); }

    /// Retrieves the milliseconds of the time of day. Requires `this->is_finite()`.
    int millisecond() const noexcept
    {
        return static_cast<int>(finite().time_of_day.count() / ticks_per_millisecond % 1000);
    }

    /**
     * \brief Returns the number of ticks since the era.
     * \details Computed as `days_since_era * ticks_per_day + time_of_day`.
     * \par Preconditions
     * `this->is_finite()`.
     * \par Exception safety
     * Strong guarantee.
     * \throws std::out_of_range If the result doesn't fit in a 64-bit integer (years
     * beyond about 29000 AD or BC).
     */
    PGTYPES_DECL std::int64_t ticks() const;

    /**
     * \brief Converts `*this` into a `time_point` (checked access).
     * \details The kind is not taken into account.
     * Fails with \ref errc::invalid_cast if `*this` is not finite or its year is
     * outside the `[1, 9999]` range.
     */
    PGTYPES_DECL boost::system::result<time_point> as_time_point() const;

    /**
     * \brief Converts to UTC, using the host's base UTC offset.
     * \details Unspecified and local values are considered local times. UTC values and sentinels
     * are returned unchanged.
     * \throws std::out_of_range If the result is out of range.
     * \throws std::runtime_error If the host's UTC offset can't be determined.
     */
    PGTYPES_DECL timestamp to_universal_time() const;

    /**
     * \brief Converts to UTC, with an explicit UTC offset.
     * \details As \ref to_universal_time(), but `offset` is used instead of the host's
     * offset (local = UTC + offset).
     * \throws std::out_of_range If the result is out of range.
     */
    PGTYPES_DECL timestamp to_universal_time(timespan offset) const;

    /**
     * \brief Converts to local time, using the host's base UTC offset.
     * \details Unspecified and UTC values are considered UTC times. Local values and sentinels
     * are returned unchanged.
     * \throws std::out_of_range If the result is out of range.
     * \throws std::runtime_error If the host's UTC offset can't be determined.
     */
    PGTYPES_DECL timestamp to_local_time() const;

    /**
     * \brief Converts to local time, with an explicit UTC offset.
     * \throws std::out_of_range If the result is out of range.
     */
    PGTYPES_DECL timestamp to_local_time(timespan offset) const;

    /**
     * \brief Adds a number of ticks.
     * \details The result holds a normalized time of day and keeps the kind. Sentinels are
     * returned unchanged.
     * \throws std::out_of_range If the result is out of range.
     */
    PGTYPES_DECL timestamp add_ticks(std::int64_t value) const;

    /// Adds a duration. Equivalent to `add_ticks(value.count())`.
    timestamp add(timespan value) const { return add_ticks(value.count()); }

    /**
     * \brief Adds a number of fractional days, rounded to the nearest millisecond.
     * \throws std::invalid_argument If `value` is NaN.
     * \throws std::out_of_range If the result is out of range.
     */
    timestamp add_days(double value) const { return add(from_days(value)); }

    /// \copydoc add_days
    timestamp add_hours(double value) const { return add(from_hours(value)); }

    /// \copydoc add_days
    timestamp add_minutes(double value) const { return add(from_minutes(value)); }

    /// \copydoc add_days
    timestamp add_seconds(double value) const { return add(from_seconds(value)); }

    /// \copydoc add_days
    timestamp add_milliseconds(double value) const { return add(from_milliseconds(value)); }

    /**
     * \brief Adds a number of months, using \ref date::add_months.
     * \details The time of day and kind are kept. Sentinels are returned unchanged.
     * \throws std::out_of_range If the result is out of range.
     */
    PGTYPES_DECL timestamp add_months(std::int64_t value) const;

    /**
     * \brief Adds a number of years, using \ref date::add_years.
     * \details The time of day and kind are kept. Sentinels are returned unchanged.
     * \throws std::out_of_range If the result is out of range.
     */
    PGTYPES_DECL timestamp add_years(std::int64_t value) const;

    /**
     * \brief Subtracts a duration. Equivalent to `add(-value)`.
     * \throws std::out_of_range If the result is out of range.
     */
    PGTYPES_DECL timestamp subtract(timespan value) const;

    /**
     * \brief Computes the duration between `*this` and `other`.
     * \details The kinds are not taken into account. Fails with \ref errc::invalid_operation
     * if any of the operands is a sentinel, and with \ref errc::overflow if the result doesn't
     * fit in a \ref timespan.
     */
    PGTYPES_DECL boost::system::result<timespan> subtract(const timestamp& other) const;

    /**
     * \brief Brings the time of day to the `[0, 24h)` range, adjusting the date.
     * \details Equivalent to `add(timespan(0))`.
     * \throws std::out_of_range If the result is out of range.
     */
    timestamp normalize() const { return add(timespan(0)); }

    /// Three-way comparison. Returns a negative, zero or positive value.
    PGTYPES_DECL int compare(const timestamp& other) const noexcept;

    /**
     * \brief Compares against a dynamically typed value.
     * \details A null value compares less than any timestamp. Fails with
     * \ref errc::invalid_argument if `other` holds anything but a null or a timestamp.
     */
    PGTYPES_DECL boost::system::result<int> compare_to(const value_view& other) const;

    /**
     * \brief Formats the timestamp.
     * \details Sentinels are formatted as `infinity` and `-infinity`. Finite values
     * use `<date> <time>`, where each part is formatted as in \ref date::to_string and
     * \ref timespan_to_string.
     */
    PGTYPES_DECL std::string to_string() const;

    /**
     * \brief Parses a timestamp.
     * \details
     * Accepts `infinity`, `-infinity` and `<date> <time>`, where the date may be followed
     * by a `BC` marker, either before or after the time. Case-insensitive.
     * Anything after the time, other than the era marker, is ignored.
     * The result is always \ref timestamp_kind::unspecified.
     * \n
     * Fails with \ref errc::overflow if a component is out of range, and with
     * \ref errc::format_error in any other case.
     */
    PGTYPES_DECL static boost::system::result<timestamp> parse(string_view from);

    /**
     * \brief Parses a NULL-terminated string.
     * \details As \ref parse(string_view), but fails with \ref errc::null_argument if `from`
     * is `nullptr`.
     */
    PGTYPES_DECL static boost::system::result<timestamp> parse(const char* from);

    /**
     * \brief Tests for equality.
     * \details Sentinels are equal to themselves. Finite values are equal if their dates
     * and times of day are equal. The kind is not taken into account.
     */
    PGTYPES_DECL bool operator==(const timestamp& rhs) const noexcept;

    /// Tests for inequality.
    bool operator!=(const timestamp& rhs) const noexcept { return !(*this == rhs); }

    /// Ordering.
    bool operator<(const timestamp& rhs) const noexcept { return compare(rhs) < 0; }
    bool operator<=(const timestamp& rhs) const noexcept { return compare(rhs) <= 0; }
    bool operator>(const timestamp& rhs) const noexcept { return compare(rhs) > 0; }
    bool operator>=(const timestamp& rhs) const noexcept { return compare(rhs) >= 0; }

    /// Adds a duration.
    timestamp operator+(timespan rhs) const { return add(rhs); }

    /// Subtracts a duration.
    timestamp operator-(timespan rhs) const { return subtract(rhs); }

private:
    variant_type impl_;

    const finite_value& finite() const noexcept
    {
        BOOST_ASSERT(is_finite());
        return *if_finite();
    }
};

/// Adds a duration to a timestamp.
inline timestamp operator+(timespan lhs, const timestamp& rhs) { return rhs.add(lhs); }

/**
 * \brief Function object comparing timestamps.
 * \details Mirrors the ordering of \ref timestamp::compare, for use in generic sorting contexts.
 */
struct timestamp_comparer
{
    /// Three-way comparison.
    int compare(const timestamp& lhs, const timestamp& rhs) const noexcept { return lhs.compare(rhs); }

    /**
     * \brief Three-way comparison of dynamically typed values.
     * \details Nulls compare equal to other nulls and less than anything else.
     * Fails with \ref errc::invalid_argument if a non-null value is not a timestamp.
     */
    PGTYPES_DECL boost::system::result<int> compare(const value_view& lhs, const value_view& rhs) const;

    /// Strict weak ordering, as required by standard algorithms.
    bool operator()(const timestamp& lhs, const timestamp& rhs) const noexcept { return lhs.compare(rhs) < 0; }
};

/**
 * \relates timestamp
 * \brief Streams a timestamp, using the same format as \ref timestamp::to_string.
 */
PGTYPES_DECL
std::ostream& operator<<(std::ostream& os, const timestamp& v);

/// Streams a timestamp kind.
PGTYPES_DECL
std::ostream& operator<<(std::ostream& os, timestamp_kind v);

}  // namespace pgtypes

namespace std {

/// Hashes timestamps consistently with `operator==`. The kind is not taken into account.
template <>
struct hash<pgtypes::timestamp>
{
    std::size_t operator()(const pgtypes::timestamp& v) const noexcept
    {
        if (v.is_infinity())
            return static_cast<std::size_t>(1);
        if (v.is_negative_infinity())
            return static_cast<std::size_t>(2);
        std::size_t res = 0;
        boost::hash_combine(res, v.date().days_since_era());
        boost::hash_combine(res, v.time_of_day().count());
        return res;
    }
};

}  // namespace std

#ifdef PGTYPES_HEADER_ONLY
#include <pgtypes/impl/timestamp.ipp>

// Defines the overloads taking a value_view
#include <pgtypes/value_view.hpp>
#endif

#endif

//
// Copyright (c) 2019-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGTYPES_CIRCLE_HPP
#define PGTYPES_CIRCLE_HPP

#include <pgtypes/point.hpp>
#include <pgtypes/string_view.hpp>

#include <pgtypes/detail/config.hpp>

#include <boost/system/result.hpp>

#include <iosfwd>
#include <string>

namespace pgtypes {

/**
 * \brief Type representing a PostgreSQL `CIRCLE` value.
 * \details A center point and a radius, as three IEEE-754 doubles.
 * This is also the order the fields have in the binary protocol.
 */
struct circle
{
    /// The x coordinate of the center.
    double x{};

    /// The y coordinate of the center.
    double y{};

    /// The radius.
    double radius{};

    /// Constructs a circle with center at the origin and zero radius.
    constexpr circle() noexcept = default;

    /// Constructs a circle from its center coordinates and radius.
    constexpr circle(double x, double y, double radius) noexcept : x(x), y(y), radius(radius) {}

    /// Constructs a circle from its center and radius.
    constexpr circle(point center, double radius) noexcept : x(center.x), y(center.y), radius(radius) {}

    /// Returns the center.
    constexpr point center() const noexcept { return point(x, y); }

    /// Formats the circle as `<(x,y),r>`, using the shortest representation of each number.
    PGTYPES_DECL std::string to_string() const;

    /**
     * \brief Parses a circle.
     * \details
     * Accepts `<(x,y),r>`, `((x,y),r)`, `(x,y),r` and `x,y,r`. Whitespace around
     * the numbers is ignored.
     * \n
     * Fails with \ref errc::overflow if a number doesn't fit in a double, and with
     * \ref errc::format_error in any other case, including negative radiuses.
     */
    PGTYPES_DECL static boost::system::result<circle> parse(string_view from);

    /// Tests for equality. Fields are compared as doubles.
    constexpr bool operator==(const circle& rhs) const noexcept
    {
        return x == rhs.x && y == rhs.y && radius == rhs.radius;
    }

    /// Tests for inequality.
    constexpr bool operator!=(const circle& rhs) const noexcept { return !(*this == rhs); }
};

/**
 * \relates circle
 * \brief Streams a circle, using the same format as \ref circle::to_string.
 */
PGTYPES_DECL
std::ostream& operator<<(std::ostream& os, const circle& v);

}  // namespace pgtypes

#ifdef PGTYPES_HEADER_ONLY
#include <pgtypes/impl/circle.ipp>
#endif

#endif

//
// Copyright (c) 2019-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGTYPES_POINT_HPP
#define PGTYPES_POINT_HPP

#include <pgtypes/string_view.hpp>

#include <pgtypes/detail/config.hpp>

#include <boost/system/result.hpp>

#include <iosfwd>
#include <string>

namespace pgtypes {

/**
 * \brief Type representing a PostgreSQL `POINT` value.
 * \details A point in a two-dimensional plane, as a pair of IEEE-754 doubles.
 */
struct point
{
    /// The x coordinate.
    double x{};

    /// The y coordinate.
    double y{};

    /// Constructs a point at the origin.
    constexpr point() noexcept = default;

    /// Constructs a point from its coordinates.
    constexpr point(double x, double y) noexcept : x(x), y(y) {}

    /// Formats the point as `(x,y)`, using the shortest representation of each coordinate.
    PGTYPES_DECL std::string to_string() const;

    /**
     * \brief Parses a point in `(x,y)` or `x,y` format.
     * \details Whitespace around the numbers is ignored.
     * Fails with \ref errc::overflow if a coordinate doesn't fit in a double, and
     * with \ref errc::format_error in any other case.
     */
    PGTYPES_DECL static boost::system::result<point> parse(string_view from);

    /// Tests for equality. Coordinates are compared as doubles.
    constexpr bool operator==(const point& rhs) const noexcept { return x == rhs.x && y == rhs.y; }

    /// Tests for inequality.
    constexpr bool operator!=(const point& rhs) const noexcept { return !(*this == rhs); }
};

/**
 * \relates point
 * \brief Streams a point, using the same format as \ref point::to_string.
 */
PGTYPES_DECL
std::ostream& operator<<(std::ostream& os, const point& v);

}  // namespace pgtypes

#ifdef PGTYPES_HEADER_ONLY
#include <pgtypes/impl/point.ipp>
#endif

#endif

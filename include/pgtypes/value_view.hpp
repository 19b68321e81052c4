//
// Copyright (c) 2019-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGTYPES_VALUE_VIEW_HPP
#define PGTYPES_VALUE_VIEW_HPP

#include <pgtypes/bad_value_access.hpp>
#include <pgtypes/circle.hpp>
#include <pgtypes/point.hpp>
#include <pgtypes/string_view.hpp>
#include <pgtypes/timestamp.hpp>

#include <pgtypes/detail/config.hpp>

#include <boost/assert.hpp>
#include <boost/throw_exception.hpp>
#include <boost/variant2/variant.hpp>

#include <cstddef>
#include <iosfwd>

namespace pgtypes {

/// Enumeration of the types a \ref value_view may hold.
enum class value_kind
{
    // Order here is important
    null = 0,
    float8,
    text,
    timestamp,
    point,
    circle,
};

/// Streams a value_kind.
PGTYPES_DECL
std::ostream& operator<<(std::ostream& os, value_kind v);

/**
 * \brief Non-owning variant-like class that can represent any of the values
 * exchanged with codecs.
 * \details
 * Holds NULL, a double, a string, a \ref timestamp, a \ref point or a \ref circle.
 * Strings are not owned: they point to externally owned storage, which must be kept alive
 * while the view is used. Other values are held by copy.
 * \n
 * Codecs accept a `value_view` to write either a native value or its textual representation.
 */
class value_view
{
public:
    /// The underlying sum type.
    using variant_type = boost::variant2::
        variant<boost::variant2::monostate, double, string_view, pgtypes::timestamp, pgtypes::point, pgtypes::circle>;

    /// Constructs a view holding NULL.
    value_view() = default;

    /// Constructs a view holding NULL.
    value_view(std::nullptr_t) noexcept {}

    /// Constructs a view holding a double.
    value_view(double v) noexcept : impl_(boost::variant2::in_place_type_t<double>(), v) {}

    /// Constructs a view holding a string.
    value_view(string_view v) noexcept : impl_(boost::variant2::in_place_type_t<string_view>(), v) {}

    /// Constructs a view holding a string. `v` must not be `nullptr`.
    value_view(const char* v) noexcept : value_view(string_view(v)) {}

    /// Constructs a view holding a timestamp.
    value_view(const pgtypes::timestamp& v) noexcept : impl_(v) {}

    /// Constructs a view holding a point.
    value_view(const pgtypes::point& v) noexcept : impl_(v) {}

    /// Constructs a view holding a circle.
    value_view(const pgtypes::circle& v) noexcept : impl_(v) {}

    /// Returns the type of the value this view is pointing to.
    value_kind kind() const noexcept { return static_cast<value_kind>(impl_.index()); }

    /// Returns whether this view points to a NULL value.
    bool is_null() const noexcept { return kind() == value_kind::null; }

    /// Returns whether this view points to a double.
    bool is_float8() const noexcept { return kind() == value_kind::float8; }

    /// Returns whether this view points to a string.
    bool is_text() const noexcept { return kind() == value_kind::text; }

    /// Returns whether this view points to a timestamp.
    bool is_timestamp() const noexcept { return kind() == value_kind::timestamp; }

    /// Returns whether this view points to a point.
    bool is_point() const noexcept { return kind() == value_kind::point; }

    /// Returns whether this view points to a circle.
    bool is_circle() const noexcept { return kind() == value_kind::circle; }

    /// \brief Retrieves the underlying value as a double or throws an exception.
    /// \details If `!this->is_float8()`, throws \ref bad_value_access.
    double as_float8() const { return checked<double>(); }

    /// \brief Retrieves the underlying value as a string or throws an exception.
    /// \details If `!this->is_text()`, throws \ref bad_value_access.
    string_view as_text() const { return checked<string_view>(); }

    /// \brief Retrieves the underlying value as a timestamp or throws an exception.
    /// \details If `!this->is_timestamp()`, throws \ref bad_value_access.
    const pgtypes::timestamp& as_timestamp() const { return checked<pgtypes::timestamp>(); }

    /// \brief Retrieves the underlying value as a point or throws an exception.
    /// \details If `!this->is_point()`, throws \ref bad_value_access.
    const pgtypes::point& as_point() const { return checked<pgtypes::point>(); }

    /// \brief Retrieves the underlying value as a circle or throws an exception.
    /// \details If `!this->is_circle()`, throws \ref bad_value_access.
    const pgtypes::circle& as_circle() const { return checked<pgtypes::circle>(); }

    /// \brief Retrieves the underlying value as a double (unchecked access).
    /// \details If `!this->is_float8()`, results in undefined behavior.
    double get_float8() const noexcept { return unchecked<double>(); }

    /// \brief Retrieves the underlying value as a string (unchecked access).
    /// \details If `!this->is_text()`, results in undefined behavior.
    string_view get_text() const noexcept { return unchecked<string_view>(); }

    /// \brief Retrieves the underlying value as a timestamp (unchecked access).
    /// \details If `!this->is_timestamp()`, results in undefined behavior.
    const pgtypes::timestamp& get_timestamp() const noexcept { return unchecked<pgtypes::timestamp>(); }

    /// \brief Retrieves the underlying value as a point (unchecked access).
    /// \details If `!this->is_point()`, results in undefined behavior.
    const pgtypes::point& get_point() const noexcept { return unchecked<pgtypes::point>(); }

    /// \brief Retrieves the underlying value as a circle (unchecked access).
    /// \details If `!this->is_circle()`, results in undefined behavior.
    const pgtypes::circle& get_circle() const noexcept { return unchecked<pgtypes::circle>(); }

    /// Returns the underlying variant.
    const variant_type& to_variant() const noexcept { return impl_; }

    /**
     * \brief Tests for equality.
     * \details Views of different kinds are never equal. Strings are compared by content.
     */
    bool operator==(const value_view& rhs) const noexcept { return impl_ == rhs.impl_; }

    /// Tests for inequality.
    bool operator!=(const value_view& rhs) const noexcept { return !(*this == rhs); }

private:
    variant_type impl_;

    template <class T>
    const T& checked() const
    {
        auto* res = boost::variant2::get_if<T>(&impl_);
        if (!res)
            BOOST_THROW_EXCEPTION(bad_value_access());
        return *res;
    }

    template <class T>
    const T& unchecked() const noexcept
    {
        auto* res = boost::variant2::get_if<T>(&impl_);
        BOOST_ASSERT(res != nullptr);
        return *res;
    }
};

/**
 * \relates value_view
 * \brief Streams a value_view.
 * \details NULL values are streamed as `<NULL>`. Other values use their own text format.
 */
PGTYPES_DECL
std::ostream& operator<<(std::ostream& os, const value_view& v);

}  // namespace pgtypes

#ifdef PGTYPES_HEADER_ONLY
#include <pgtypes/impl/value_view.ipp>
#endif

#endif

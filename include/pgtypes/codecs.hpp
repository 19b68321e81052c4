//
// Copyright (c) 2019-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGTYPES_CODECS_HPP
#define PGTYPES_CODECS_HPP

#include <pgtypes/circle.hpp>
#include <pgtypes/errc.hpp>
#include <pgtypes/error_code.hpp>
#include <pgtypes/point.hpp>
#include <pgtypes/timestamp.hpp>
#include <pgtypes/type_oid.hpp>
#include <pgtypes/value_view.hpp>

#include <pgtypes/detail/config.hpp>
#include <pgtypes/detail/protocol_types.hpp>

#include <boost/core/ignore_unused.hpp>
#include <boost/core/span.hpp>
#include <boost/system/result.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace pgtypes {

/**
 * \brief Binary codec for a type with a statically known wire size.
 * \details
 * Implements the binary wire format of a PostgreSQL type whose values always have the same length.
 * `Traits` provides the type-specific parts:
 *
 *   - `value_type`: the native C++ type.
 *   - `oid`: a `static constexpr` \ref type_oid.
 *   - `wire_size`: a `static constexpr std::size_t`, the length of every value in bytes.
 *   - `static const value_type* if_native(const value_view&)`, returning `nullptr`
 *     if the view doesn't hold a `value_type`.
 *   - `static void serialize(detail::serialization_context&, const value_type&)`, which must write
 *     exactly `wire_size` bytes or set an error in the context.
 *   - `static detail::deserialize_errc deserialize(detail::deserialization_context&, value_type&)`.
 *
 * `value_type` must provide `to_string()` and a static `parse(string_view)`
 * returning `boost::system::result<value_type>`, used for the textual forms.
 */
template <class Traits>
class fixed_width_codec
{
public:
    /// The native C++ type.
    using value_type = typename Traits::value_type;

    /// The PostgreSQL type this codec handles.
    static constexpr type_oid oid = Traits::oid;

    /// The length of every value, in bytes.
    static constexpr std::size_t wire_size = Traits::wire_size;

    /**
     * \brief Computes the length that writing `value` will produce.
     * \details Always returns \ref wire_size, regardless of `value`.
     */
    static std::size_t validate_and_get_length(const value_view& value) noexcept
    {
        boost::ignore_unused(value);
        return wire_size;
    }

    /**
     * \brief Reads a value from its binary representation.
     * \details
     * `declared_length` is the length the server announced for the value. It must be
     * equal to \ref wire_size; otherwise, fails with \ref errc::protocol_value_error without
     * reading anything. Fails with \ref errc::incomplete_message if `buffer` is shorter than
     * \ref wire_size. Bytes past \ref wire_size are ignored.
     */
    static boost::system::result<value_type> read(
        boost::span<const std::uint8_t> buffer,
        std::size_t declared_length
    )
    {
        if (declared_length != wire_size)
            return make_error_code(errc::protocol_value_error);
        detail::deserialization_context ctx(buffer);
        value_type res{};
        auto err = Traits::deserialize(ctx, res);
        if (err != detail::deserialize_errc::ok)
            return detail::to_error_code(err);
        return res;
    }

    /// Reads a value whose declared length is the size of `buffer`.
    static boost::system::result<value_type> read(boost::span<const std::uint8_t> buffer)
    {
        return read(buffer, buffer.size());
    }

    /**
     * \brief Reads a value from its binary representation, and renders it as text.
     * \details Fails like \ref read. The text is produced by `value_type::to_string()`.
     */
    static boost::system::result<std::string> read_text(
        boost::span<const std::uint8_t> buffer,
        std::size_t declared_length
    )
    {
        auto res = read(buffer, declared_length);
        if (res.has_error())
            return res.error();
        return res->to_string();
    }

    /**
     * \brief Appends the binary representation of `value` to `output`.
     * \details Fails with \ref errc::max_buffer_size_exceeded if the output would exceed
     * `max_buffer_size` bytes. `output` is not modified on failure.
     */
    static error_code write(
        const value_type& value,
        std::vector<std::uint8_t>& output,
        std::size_t max_buffer_size = static_cast<std::size_t>(-1)
    )
    {
        detail::serialization_context ctx(output, max_buffer_size);
        Traits::serialize(ctx, value);
        return ctx.error();
    }

    /**
     * \brief Appends the binary representation of a dynamically typed value to `output`.
     * \details
     * `value` may hold a `value_type` or a string. Strings are parsed using `value_type::parse`,
     * and parse errors are returned as is. Fails with \ref errc::invalid_cast if `value`
     * holds anything else (including NULL).
     */
    static error_code write(
        const value_view& value,
        std::vector<std::uint8_t>& output,
        std::size_t max_buffer_size = static_cast<std::size_t>(-1)
    )
    {
        const value_type* native = Traits::if_native(value);
        if (native)
            return write(*native, output, max_buffer_size);
        if (!value.is_text())
            return make_error_code(errc::invalid_cast);
        auto parsed = value_type::parse(value.get_text());
        if (parsed.has_error())
            return parsed.error();
        return write(*parsed, output, max_buffer_size);
    }
};

template <class Traits>
constexpr type_oid fixed_width_codec<Traits>::oid;

template <class Traits>
constexpr std::size_t fixed_width_codec<Traits>::wire_size;

/// Traits for `CIRCLE`: center x, center y and radius, as three big-endian doubles.
struct circle_traits
{
    using value_type = circle;
    static constexpr type_oid oid = type_oid::circle;
    static constexpr std::size_t wire_size = 24u;

    static const circle* if_native(const value_view& v) noexcept
    {
        return v.is_circle() ? &v.get_circle() : nullptr;
    }

    static void serialize(detail::serialization_context& ctx, const circle& v)
    {
        ctx.serialize_fixed(detail::float8{v.x}, detail::float8{v.y}, detail::float8{v.radius});
    }

    static detail::deserialize_errc deserialize(detail::deserialization_context& ctx, circle& output)
    {
        detail::float8 x{}, y{}, radius{};
        auto err = ctx.deserialize(x, y, radius);
        if (err == detail::deserialize_errc::ok)
            output = circle(x.value, y.value, radius.value);
        return err;
    }
};

/// Traits for `POINT`: x and y, as two big-endian doubles.
struct point_traits
{
    using value_type = point;
    static constexpr type_oid oid = type_oid::point;
    static constexpr std::size_t wire_size = 16u;

    static const point* if_native(const value_view& v) noexcept
    {
        return v.is_point() ? &v.get_point() : nullptr;
    }

    static void serialize(detail::serialization_context& ctx, const point& v)
    {
        ctx.serialize_fixed(detail::float8{v.x}, detail::float8{v.y});
    }

    static detail::deserialize_errc deserialize(detail::deserialization_context& ctx, point& output)
    {
        detail::float8 x{}, y{};
        auto err = ctx.deserialize(x, y);
        if (err == detail::deserialize_errc::ok)
            output = point(x.value, y.value);
        return err;
    }
};

/**
 * \brief Traits for `TIMESTAMP`.
 * \details Values are a big-endian 64-bit count of microseconds since 2000-01-01 00:00:00.
 * The maximum and minimum counts represent `infinity` and `-infinity`. Values read have
 * \ref timestamp_kind::unspecified. The kind of written values is ignored, and ticks
 * smaller than a microsecond are discarded (rounding towards negative infinity).
 * Writing a value that can't be represented sets \ref errc::overflow.
 */
struct timestamp_traits
{
    using value_type = timestamp;
    static constexpr type_oid oid = type_oid::timestamp;
    static constexpr std::size_t wire_size = 8u;

    static const timestamp* if_native(const value_view& v) noexcept
    {
        return v.is_timestamp() ? &v.get_timestamp() : nullptr;
    }

    PGTYPES_DECL static void serialize(detail::serialization_context& ctx, const timestamp& v);

    PGTYPES_DECL static detail::deserialize_errc deserialize(
        detail::deserialization_context& ctx,
        timestamp& output
    );
};

namespace detail {

// Writes v, shifted to UTC by subtracting utc_offset, as microseconds since 2000-01-01.
// Sets errc::overflow in ctx if the result is out of range.
PGTYPES_DECL void serialize_timestamp_micros(
    serialization_context& ctx,
    const timestamp& v,
    timespan utc_offset
);

}  // namespace detail

/**
 * \brief Traits for `TIMESTAMPTZ`.
 * \details Same wire format as \ref timestamp_traits, always in UTC. Local and unspecified values
 * are shifted by the host's base UTC offset before writing, as \ref timestamp::to_universal_time does.
 * A result out of range is reported as \ref errc::overflow. Values read have \ref timestamp_kind::utc.
 */
struct timestamptz_traits
{
    using value_type = timestamp;
    static constexpr type_oid oid = type_oid::timestamptz;
    static constexpr std::size_t wire_size = 8u;

    static const timestamp* if_native(const value_view& v) noexcept
    {
        return v.is_timestamp() ? &v.get_timestamp() : nullptr;
    }

    PGTYPES_DECL static void serialize(detail::serialization_context& ctx, const timestamp& v);

    PGTYPES_DECL static detail::deserialize_errc deserialize(
        detail::deserialization_context& ctx,
        timestamp& output
    );
};

/// Codec for `CIRCLE` values (24 bytes).
using circle_codec = fixed_width_codec<circle_traits>;

/// Codec for `POINT` values (16 bytes).
using point_codec = fixed_width_codec<point_traits>;

/// Codec for `TIMESTAMP` values (8 bytes).
using timestamp_codec = fixed_width_codec<timestamp_traits>;

/// Codec for `TIMESTAMPTZ` values (8 bytes).
using timestamptz_codec = fixed_width_codec<timestamptz_traits>;

}  // namespace pgtypes

#ifdef PGTYPES_HEADER_ONLY
#include <pgtypes/impl/codecs.ipp>
#endif

#endif

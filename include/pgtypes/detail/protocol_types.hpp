//
// Copyright (c) 2019-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGTYPES_DETAIL_PROTOCOL_TYPES_HPP
#define PGTYPES_DETAIL_PROTOCOL_TYPES_HPP

#include <pgtypes/detail/deserialization_context.hpp>
#include <pgtypes/detail/serialization_context.hpp>

#include <boost/endian/conversion.hpp>

#include <cstddef>
#include <cstdint>

namespace pgtypes {
namespace detail {

// Fixed-size numbers, in network byte order (big endian)
template <class T>
struct big_endian_holder
{
    T value;

    // This is a fixed-size type
    static constexpr std::size_t size = sizeof(T);

    void serialize_fixed(std::uint8_t* to) const
    {
        boost::endian::endian_store<T, sizeof(T), boost::endian::order::big>(to, value);
    }

    void serialize(serialization_context& ctx) const { ctx.serialize_fixed(*this); }

    deserialize_errc deserialize(deserialization_context& ctx)
    {
        constexpr std::size_t sz = sizeof(T);
        if (!ctx.enough_size(sz))
        {
            return deserialize_errc::incomplete_message;
        }
        value = boost::endian::endian_load<T, sz, boost::endian::order::big>(ctx.first());
        ctx.advance(sz);
        return deserialize_errc::ok;
    }
};

template <class T>
constexpr std::size_t big_endian_holder<T>::size;

using int8 = big_endian_holder<std::int64_t>;
using float8 = big_endian_holder<double>;

}  // namespace detail
}  // namespace pgtypes

#endif

//
// Copyright (c) 2019-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGTYPES_TYPE_OID_HPP
#define PGTYPES_TYPE_OID_HPP

#include <cstdint>

namespace pgtypes {

/**
 * \brief PostgreSQL type identifiers (the `oid` column of `pg_type`) handled by this library.
 * \details Used by dispatch code to select a codec for a wire value.
 */
enum class type_oid : std::uint32_t
{
    /// `POINT`.
    point = 600,

    /// `CIRCLE`.
    circle = 718,

    /// `TIMESTAMP` (without time zone).
    timestamp = 1114,

    /// `TIMESTAMPTZ` (with time zone).
    timestamptz = 1184,
};

}  // namespace pgtypes

#endif

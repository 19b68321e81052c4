//
// Copyright (c) 2019-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGTYPES_IMPL_CODECS_IPP
#define PGTYPES_IMPL_CODECS_IPP

#pragma once

#include <pgtypes/codecs.hpp>
#include <pgtypes/errc.hpp>

#include <pgtypes/detail/calendar.hpp>
#include <pgtypes/detail/local_offset.hpp>

#include <cstdint>
#include <limits>

namespace pgtypes {
namespace detail {

// PostgreSQL's timestamp epoch, 2000-01-01, as days since the era
constexpr std::int64_t pg_epoch_days = 730119;
constexpr std::int64_t micros_per_day = 86400000000;
constexpr std::int64_t ticks_per_micro = 10;
constexpr std::int64_t pg_infinity = (std::numeric_limits<std::int64_t>::max)();
constexpr std::int64_t pg_negative_infinity = (std::numeric_limits<std::int64_t>::min)();

PGTYPES_STATIC_OR_INLINE deserialize_errc deserialize_timestamp_micros(
    deserialization_context& ctx,
    timestamp_kind kind,
    timestamp& output
)
{
    int8 micros{};
    auto err = ctx.deserialize(micros);
    if (err != deserialize_errc::ok)
        return err;

    if (micros.value == pg_infinity)
    {
        output = timestamp::infinity();
        return deserialize_errc::ok;
    }
    if (micros.value == pg_negative_infinity)
    {
        output = timestamp::negative_infinity();
        return deserialize_errc::ok;
    }

    std::int64_t days = floor_div(micros.value, micros_per_day) + pg_epoch_days;
    std::int64_t tod = floor_mod(micros.value, micros_per_day) * ticks_per_micro;
    if (days < min_days_since_era || days > max_days_since_era)
        return deserialize_errc::protocol_value_error;
    output = timestamp(date::from_days_since_era(days), timespan(tod), kind);
    return deserialize_errc::ok;
}

}  // namespace detail
}  // namespace pgtypes

void pgtypes::detail::serialize_timestamp_micros(
    serialization_context& ctx,
    const timestamp& v,
    timespan utc_offset
)
{
    auto* f = v.if_finite();
    if (!f)
    {
        ctx.serialize_fixed(int8{v.is_infinity() ? pg_infinity : pg_negative_infinity});
        return;
    }

    // Apply the offset and normalize without throwing
    auto tod = f->time_of_day.count();
    auto off = utc_offset.count();
    std::int64_t days = f->date.days_since_era() + floor_div(tod, ticks_per_day) - floor_div(off, ticks_per_day);
    std::int64_t ticks_of_day = floor_mod(tod, ticks_per_day) - floor_mod(off, ticks_per_day);
    if (ticks_of_day < 0)
    {
        ticks_of_day += ticks_per_day;
        --days;
    }
    if (days < min_days_since_era || days > max_days_since_era)
    {
        ctx.add_error(errc::overflow);
        return;
    }
    days -= pg_epoch_days;
    std::int64_t micros_of_day = ticks_of_day / ticks_per_micro;

    // The sentinels are reserved, so they count as out of range
    constexpr std::int64_t max_days = pg_infinity / micros_per_day;
    constexpr std::int64_t min_days = pg_negative_infinity / micros_per_day;
    if (days > max_days || days < min_days)
    {
        ctx.add_error(errc::overflow);
        return;
    }
    std::int64_t day_micros = days * micros_per_day;
    if (day_micros > pg_infinity - micros_of_day - 1)
    {
        ctx.add_error(errc::overflow);
        return;
    }
    ctx.serialize_fixed(int8{day_micros + micros_of_day});
}

void pgtypes::timestamp_traits::serialize(detail::serialization_context& ctx, const timestamp& v)
{
    detail::serialize_timestamp_micros(ctx, v, timespan(0));
}

pgtypes::detail::deserialize_errc pgtypes::timestamp_traits::deserialize(
    detail::deserialization_context& ctx,
    timestamp& output
)
{
    return detail::deserialize_timestamp_micros(ctx, timestamp_kind::unspecified, output);
}

void pgtypes::timestamptz_traits::serialize(detail::serialization_context& ctx, const timestamp& v)
{
    // Sentinels and UTC values don't need the host's offset
    if (v.kind() == timestamp_kind::utc || !v.is_finite())
    {
        detail::serialize_timestamp_micros(ctx, v, timespan(0));
        return;
    }
    auto offset = detail::try_local_utc_offset();
    if (offset.has_error())
    {
        ctx.add_error(offset.error());
        return;
    }
    detail::serialize_timestamp_micros(ctx, v, *offset);
}

pgtypes::detail::deserialize_errc pgtypes::timestamptz_traits::deserialize(
    detail::deserialization_context& ctx,
    timestamp& output
)
{
    return detail::deserialize_timestamp_micros(ctx, timestamp_kind::utc, output);
}

#endif

//
// Copyright (c) 2019-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGTYPES_IMPL_LOCAL_OFFSET_IPP
#define PGTYPES_IMPL_LOCAL_OFFSET_IPP

#pragma once

#include <pgtypes/errc.hpp>

#include <pgtypes/detail/local_offset.hpp>

#include <boost/throw_exception.hpp>

#include <cstdint>
#include <ctime>
#include <stdexcept>

boost::system::result<pgtypes::timespan> pgtypes::detail::utc_offset_at(std::time_t t, bool include_dst) noexcept
{
    // Break down t as UTC, then interpret the fields as a local time with the
    // daylight saving flag we want. The difference between both instants is the offset.
    std::tm utc_tm{};
#ifdef _WIN32
    if (gmtime_s(&utc_tm, &t) != 0)
#else
    if (gmtime_r(&t, &utc_tm) == nullptr)
#endif
        return make_error_code(errc::invalid_operation);

    int is_dst = 0;
    if (include_dst)
    {
        std::tm local_tm{};
#ifdef _WIN32
        if (localtime_s(&local_tm, &t) != 0)
#else
        if (localtime_r(&t, &local_tm) == nullptr)
#endif
            return make_error_code(errc::invalid_operation);
        is_dst = local_tm.tm_isdst > 0 ? 1 : 0;
    }
    utc_tm.tm_isdst = is_dst;

    std::time_t as_local = std::mktime(&utc_tm);
    if (as_local == static_cast<std::time_t>(-1))
        return make_error_code(errc::invalid_operation);

    auto offset_seconds = static_cast<std::int64_t>(std::difftime(t, as_local));
    return timespan(offset_seconds * ticks_per_second);
}

boost::system::result<pgtypes::timespan> pgtypes::detail::try_local_utc_offset() noexcept
{
    std::time_t now = std::time(nullptr);
    if (now == static_cast<std::time_t>(-1))
        return make_error_code(errc::invalid_operation);
    return utc_offset_at(now, false);
}

pgtypes::timespan pgtypes::detail::local_utc_offset()
{
    auto res = try_local_utc_offset();
    if (res.has_error())
        BOOST_THROW_EXCEPTION(std::runtime_error("local_utc_offset: can't get the host's UTC offset"));
    return *res;
}

#endif

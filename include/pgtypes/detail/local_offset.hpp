//
// Copyright (c) 2019-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGTYPES_DETAIL_LOCAL_OFFSET_HPP
#define PGTYPES_DETAIL_LOCAL_OFFSET_HPP

#include <pgtypes/timespan.hpp>

#include <pgtypes/detail/config.hpp>

#include <boost/system/result.hpp>

#include <ctime>

namespace pgtypes {
namespace detail {

// The host's UTC offset at instant t, such that local = utc + offset.
// include_dst selects whether daylight saving time at t is taken into account.
// Fails with errc::invalid_operation if the C runtime can't compute it.
PGTYPES_DECL boost::system::result<timespan> utc_offset_at(std::time_t t, bool include_dst) noexcept;

// The host's current base UTC offset (standard time, ignoring daylight saving)
PGTYPES_DECL boost::system::result<timespan> try_local_utc_offset() noexcept;

// As try_local_utc_offset, but throws std::runtime_error on failure
PGTYPES_DECL timespan local_utc_offset();

}  // namespace detail
}  // namespace pgtypes

#ifdef PGTYPES_HEADER_ONLY
#include <pgtypes/impl/local_offset.ipp>
#endif

#endif

//
// Copyright (c) 2019-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGTYPES_IMPL_VALUE_VIEW_IPP
#define PGTYPES_IMPL_VALUE_VIEW_IPP

#pragma once

#include <pgtypes/errc.hpp>
#include <pgtypes/timestamp.hpp>
#include <pgtypes/value_view.hpp>

#include <pgtypes/detail/text_parsing.hpp>

#include <ostream>
#include <string>

namespace pgtypes {
namespace detail {

class value_print_visitor
{
    std::ostream& os_;

public:
    explicit value_print_visitor(std::ostream& os) noexcept : os_(os) {}

    void operator()(boost::variant2::monostate) const { os_ << "<NULL>"; }
    void operator()(double v) const
    {
        std::string s;
        append_double(s, v);
        os_ << s;
    }
    void operator()(string_view v) const { os_ << v; }
    void operator()(const timestamp& v) const { os_ << v; }
    void operator()(const point& v) const { os_ << v; }
    void operator()(const circle& v) const { os_ << v; }
};

}  // namespace detail
}  // namespace pgtypes

// timestamp operations that need the complete value_view type
boost::system::result<int> pgtypes::timestamp::compare_to(const value_view& other) const
{
    if (other.is_null())
        return 1;
    if (!other.is_timestamp())
        return make_error_code(errc::invalid_argument);
    return compare(other.get_timestamp());
}

boost::system::result<int> pgtypes::timestamp_comparer::compare(const value_view& lhs, const value_view& rhs)
    const
{
    if (lhs.is_null())
        return rhs.is_null() ? 0 : -1;
    if (rhs.is_null())
        return 1;
    if (!lhs.is_timestamp() || !rhs.is_timestamp())
        return make_error_code(errc::invalid_argument);
    return compare(lhs.get_timestamp(), rhs.get_timestamp());
}

std::ostream& pgtypes::operator<<(std::ostream& os, value_kind v)
{
    switch (v)
    {
    case value_kind::null: return os << "null";
    case value_kind::float8: return os << "float8";
    case value_kind::text: return os << "text";
    case value_kind::timestamp: return os << "timestamp";
    case value_kind::point: return os << "point";
    case value_kind::circle: return os << "circle";
    default: return os << "<unknown value_kind>";
    }
}

std::ostream& pgtypes::operator<<(std::ostream& os, const value_view& v)
{
    boost::variant2::visit(detail::value_print_visitor(os), v.to_variant());
    return os;
}

#endif

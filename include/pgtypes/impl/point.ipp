//
// Copyright (c) 2019-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGTYPES_IMPL_POINT_IPP
#define PGTYPES_IMPL_POINT_IPP

#pragma once

#include <pgtypes/errc.hpp>
#include <pgtypes/point.hpp>

#include <pgtypes/detail/text_parsing.hpp>

#include <ostream>

namespace pgtypes {
namespace detail {

// (x,y) or x,y
PGTYPES_STATIC_OR_INLINE parse_errc parse_point_text(const char*& it, const char* end, point& output)
{
    bool has_parens = consume(it, end, '(');

    skip_spaces(it, end);
    auto err = parse_double_prefix(it, end, output.x);
    if (err != parse_errc::ok)
        return err;
    if (!consume(it, end, ','))
        return parse_errc::format_error;
    skip_spaces(it, end);
    err = parse_double_prefix(it, end, output.y);
    if (err != parse_errc::ok)
        return err;

    if (has_parens && !consume(it, end, ')'))
        return parse_errc::format_error;
    return parse_errc::ok;
}

}  // namespace detail
}  // namespace pgtypes

std::string pgtypes::point::to_string() const
{
    std::string res = "(";
    detail::append_double(res, x);
    res += ',';
    detail::append_double(res, y);
    res += ')';
    return res;
}

boost::system::result<pgtypes::point> pgtypes::point::parse(string_view from)
{
    const char* it = from.data();
    const char* end = it + from.size();
    point res;
    auto err = detail::parse_point_text(it, end, res);
    if (err != detail::parse_errc::ok)
        return detail::to_error_code(err);
    detail::skip_spaces(it, end);
    if (it != end)
        return make_error_code(errc::format_error);
    return res;
}

std::ostream& pgtypes::operator<<(std::ostream& os, const point& v) { return os << v.to_string(); }

#endif

//
// Copyright (c) 2019-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGTYPES_IMPL_CIRCLE_IPP
#define PGTYPES_IMPL_CIRCLE_IPP

#pragma once

#include <pgtypes/circle.hpp>
#include <pgtypes/errc.hpp>

#include <pgtypes/detail/text_parsing.hpp>

#include <ostream>

std::string pgtypes::circle::to_string() const
{
    std::string res = "<(";
    detail::append_double(res, x);
    res += ',';
    detail::append_double(res, y);
    res += "),";
    detail::append_double(res, radius);
    res += '>';
    return res;
}

boost::system::result<pgtypes::circle> pgtypes::circle::parse(string_view from)
{
    using detail::consume;
    using detail::parse_errc;

    const char* it = from.data();
    const char* end = it + from.size();

    // Delimiters: <(x,y),r> or ((x,y),r). Otherwise, none
    char closing = '\0';
    if (consume(it, end, '<'))
    {
        closing = '>';
    }
    else
    {
        const char* lookahead = it;
        if (consume(lookahead, end, '('))
        {
            const char* after_paren = lookahead;
            if (consume(lookahead, end, '('))
            {
                it = after_paren;
                closing = ')';
            }
        }
    }

    point center;
    double radius = 0.0;
    auto err = detail::parse_point_text(it, end, center);
    if (err != parse_errc::ok)
        return detail::to_error_code(err);
    if (!consume(it, end, ','))
        return make_error_code(errc::format_error);
    detail::skip_spaces(it, end);
    err = detail::parse_double_prefix(it, end, radius);
    if (err != parse_errc::ok)
        return detail::to_error_code(err);
    if (closing && !consume(it, end, closing))
        return make_error_code(errc::format_error);
    detail::skip_spaces(it, end);
    if (it != end)
        return make_error_code(errc::format_error);

    if (radius < 0.0)
        return make_error_code(errc::format_error);
    return circle(center, radius);
}

std::ostream& pgtypes::operator<<(std::ostream& os, const circle& v) { return os << v.to_string(); }

#endif

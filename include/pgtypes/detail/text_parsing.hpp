//
// Copyright (c) 2019-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGTYPES_DETAIL_TEXT_PARSING_HPP
#define PGTYPES_DETAIL_TEXT_PARSING_HPP

#include <pgtypes/errc.hpp>
#include <pgtypes/error_code.hpp>
#include <pgtypes/string_view.hpp>

#include <boost/assert.hpp>
#include <boost/charconv/from_chars.hpp>
#include <boost/charconv/to_chars.hpp>

#include <cmath>
#include <cstddef>
#include <limits>
#include <string>
#include <system_error>

namespace pgtypes {
namespace detail {

// We operate with this enum directly in the parsing routines, then transform it to an
// actual error code
enum class parse_errc
{
    ok = 0,
    format_error,
    overflow,
};

inline error_code to_error_code(parse_errc v)
{
    switch (v)
    {
    case parse_errc::ok: return error_code();
    case parse_errc::format_error: return error_code(errc::format_error);
    case parse_errc::overflow: return error_code(errc::overflow);
    default: BOOST_ASSERT(false); return error_code();  // LCOV_EXCL_LINE
    }
}

inline bool is_space(char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

inline bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

inline string_view trim(string_view from) noexcept
{
    const char* first = from.data();
    const char* last = first + from.size();
    while (first != last && is_space(*first))
        ++first;
    while (last != first && is_space(*(last - 1)))
        --last;
    return string_view(first, static_cast<std::size_t>(last - first));
}

inline std::string to_lower_ascii(string_view from)
{
    std::string res(from.data(), from.size());
    for (char& c : res)
    {
        if (c >= 'A' && c <= 'Z')
            c = static_cast<char>(c - 'A' + 'a');
    }
    return res;
}

inline bool iequals_ascii(string_view lhs, string_view rhs) noexcept
{
    if (lhs.size() != rhs.size())
        return false;
    for (std::size_t i = 0; i < lhs.size(); ++i)
    {
        char l = lhs[i], r = rhs[i];
        if (l >= 'A' && l <= 'Z')
            l = static_cast<char>(l - 'A' + 'a');
        if (r >= 'A' && r <= 'Z')
            r = static_cast<char>(r - 'A' + 'a');
        if (l != r)
            return false;
    }
    return true;
}

// Parses a run of decimal digits starting at it. Signs are not accepted.
// On success, it points past the last digit.
template <class T>
parse_errc parse_digits(const char*& it, const char* end, T& output) noexcept
{
    if (it == end || !is_digit(*it))
        return parse_errc::format_error;
    auto res = boost::charconv::from_chars(it, end, output);
    if (res.ec == std::errc::result_out_of_range)
        return parse_errc::overflow;
    if (res.ec != std::errc())
        return parse_errc::format_error;
    it = res.ptr;
    return parse_errc::ok;
}

// Consumes word if the input starts with it, ignoring case
inline bool consume_word(const char*& it, const char* end, string_view word) noexcept
{
    if (static_cast<std::size_t>(end - it) < word.size() || !iequals_ascii(string_view(it, word.size()), word))
        return false;
    it += word.size();
    return true;
}

// Parses a double starting at it. On success, it points past the number.
// Non-finite values use PostgreSQL's spellings: NaN, [+-]Infinity and [+-]inf, in any case.
inline parse_errc parse_double_prefix(const char*& it, const char* end, double& output) noexcept
{
    if (it == end)
        return parse_errc::format_error;

    const char* first = it;
    if (consume_word(first, end, "nan"))
    {
        output = std::numeric_limits<double>::quiet_NaN();
        it = first;
        return parse_errc::ok;
    }
    bool is_negative = *first == '-';
    if (*first == '-' || *first == '+')
        ++first;
    if (consume_word(first, end, "infinity") || consume_word(first, end, "inf"))
    {
        output = is_negative ? -std::numeric_limits<double>::infinity()
                             : std::numeric_limits<double>::infinity();
        it = first;
        return parse_errc::ok;
    }

    // Any other spelling Charconv accepts for these, like -nan, is rejected
    auto res = boost::charconv::from_chars(it, end, output);
    if (res.ec == std::errc::result_out_of_range)
        return parse_errc::overflow;
    if (res.ec != std::errc() || std::isnan(output) || std::isinf(output))
        return parse_errc::format_error;
    it = res.ptr;
    return parse_errc::ok;
}

inline void skip_spaces(const char*& it, const char* end) noexcept
{
    while (it != end && is_space(*it))
        ++it;
}

// Skips whitespace, then consumes c
inline bool consume(const char*& it, const char* end, char c) noexcept
{
    skip_spaces(it, end);
    if (it == end || *it != c)
        return false;
    ++it;
    return true;
}

// Appends the shortest representation of v that parses back to the same value.
// Non-finite values are rendered as PostgreSQL does.
inline void append_double(std::string& to, double v)
{
    if (std::isnan(v))
    {
        to += "NaN";
        return;
    }
    if (std::isinf(v))
    {
        to += v < 0 ? "-Infinity" : "Infinity";
        return;
    }
    char buff[32];
    auto res = boost::charconv::to_chars(buff, buff + sizeof(buff), v);
    BOOST_ASSERT(res.ec == std::errc());
    to.append(buff, res.ptr);
}

}  // namespace detail
}  // namespace pgtypes

#endif

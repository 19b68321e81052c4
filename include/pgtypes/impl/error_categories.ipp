//
// Copyright (c) 2019-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGTYPES_IMPL_ERROR_CATEGORIES_IPP
#define PGTYPES_IMPL_ERROR_CATEGORIES_IPP

#pragma once

#include <pgtypes/errc.hpp>

#include <ostream>
#include <string>

namespace pgtypes {
namespace detail {

inline const char* error_to_string(errc error) noexcept
{
    switch (error)
    {
    case errc::invalid_cast: return "The value can't be converted to the requested type";
    case errc::invalid_operation: return "The operation is not defined for infinite values";
    case errc::format_error: return "The input string was not in a correct format";
    case errc::overflow: return "A value component is out of range";
    case errc::null_argument: return "A required argument was null";
    case errc::invalid_argument: return "The argument has an incompatible type";
    case errc::incomplete_message: return "The buffer ended before the value could be read";
    case errc::protocol_value_error:
        return "The declared wire length does not match the length required by the type";
    case errc::max_buffer_size_exceeded: return "The output buffer maximum size was exceeded";
    default: return "<unknown pgtypes error>";
    }
}

class pgtypes_category_t final : public boost::system::error_category
{
public:
    const char* name() const noexcept override { return "pgtypes"; }
    std::string message(int ev) const override { return error_to_string(static_cast<errc>(ev)); }
};

}  // namespace detail
}  // namespace pgtypes

const boost::system::error_category& pgtypes::get_pgtypes_category() noexcept
{
    static detail::pgtypes_category_t res;
    return res;
}

std::ostream& pgtypes::operator<<(std::ostream& os, errc v) { return os << detail::error_to_string(v); }

#endif

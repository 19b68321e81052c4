//
// Copyright (c) 2019-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGTYPES_BAD_VALUE_ACCESS_HPP
#define PGTYPES_BAD_VALUE_ACCESS_HPP

#include <exception>

namespace pgtypes {

/// Exception type thrown when trying to access a \ref value_view with an incorrect type.
class bad_value_access : public std::exception
{
public:
    /// Returns the error message.
    const char* what() const noexcept override { return "bad_value_access"; }
};

}  // namespace pgtypes

#endif

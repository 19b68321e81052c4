//
// Copyright (c) 2019-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/core/span.hpp>

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <iomanip>
#include <ostream>

#include "test_common/assert_buffer_equals.hpp"

using namespace pgtypes;

//
// assert_buffer_equals.hpp
//
std::ostream& pgtypes::test::operator<<(std::ostream& os, buffer_printer buff)
{
    os << std::setfill('0') << std::hex << "{ ";
    for (std::size_t i = 0; i < buff.buff.size(); ++i)
    {
        os << "0x" << std::setw(2) << static_cast<int>(buff.buff.data()[i]) << ", ";
    }
    return os << "}" << std::dec;
}

bool pgtypes::test::buffer_equals(boost::span<const std::uint8_t> b1, boost::span<const std::uint8_t> b2)
{
    // If any of the buffers are empty (data() == nullptr), prevent
    // calling memcmp (UB)
    if (b1.size() == 0 || b2.size() == 0)
        return b1.size() == 0 && b2.size() == 0;

    if (b1.size() != b2.size())
        return false;

    return ::std::memcmp(b1.data(), b2.data(), b1.size()) == 0;
}

//
// Copyright (c) 2019-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <pgtypes.hpp>

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <vector>

#define ASSERT(expr)                                          \
    if (!(expr))                                              \
    {                                                         \
        std::cerr << "Assertion failed: " #expr << std::endl; \
        exit(1);                                              \
    }

void example_parse_and_arithmetic()
{
    // Parsing returns a result, rather than throwing
    auto ts = pgtypes::timestamp::parse("2024-01-31 10:00:00").value();
    ASSERT(ts.month() == 1u);

    // Month arithmetic clamps to the end of the month
    auto next = ts.add_months(1);
    std::cout << ts << " + 1 month = " << next << std::endl;
    ASSERT(next.date() == pgtypes::date(2024, 2, 29));

    // BC dates are supported
    auto ides = pgtypes::timestamp::parse("0044-03-15 12:00:00 BC").value();
    std::cout << "Ides of March: " << ides << " (weekday " << static_cast<int>(ides.day_of_week()) << ")" << std::endl;

    // Infinity sorts after any finite value
    ASSERT(pgtypes::timestamp::infinity() > next);
    std::cout << "Sentinel: " << pgtypes::timestamp::negative_infinity() << std::endl;

    auto diff = next.subtract(ts);
    ASSERT(diff.has_value());
    std::cout << "Elapsed: " << diff->count() / pgtypes::ticks_per_day << " days" << std::endl;
}

void example_codecs()
{
    // Binary wire format: three big-endian doubles
    std::vector<std::uint8_t> buffer;
    auto ec = pgtypes::circle_codec::write(pgtypes::value_view("<(1.5,-2.25),3>"), buffer);
    ASSERT(!ec);
    ASSERT(buffer.size() == pgtypes::circle_codec::wire_size);

    auto c = pgtypes::circle_codec::read(buffer, buffer.size());
    ASSERT(c.has_value());
    std::cout << "Circle: " << *c << std::endl;

    // Values that don't fit the wire format are reported as errors
    buffer.clear();
    ec = pgtypes::timestamp_codec::write(pgtypes::timestamp(pgtypes::date::max()), buffer);
    std::cout << "Writing the maximum date: " << ec.message() << std::endl;
    ASSERT(ec == pgtypes::errc::overflow);
    ASSERT(buffer.empty());

    ec = pgtypes::timestamp_codec::write(pgtypes::timestamp::infinity(), buffer);
    ASSERT(!ec);
    auto ts = pgtypes::timestamp_codec::read(buffer);
    ASSERT(ts.has_value() && ts->is_infinity());
}

int main()
{
    example_parse_and_arithmetic();
    example_codecs();
}

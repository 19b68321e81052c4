//
// Copyright (c) 2019-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGTYPES_DETAIL_SERIALIZATION_CONTEXT_HPP
#define PGTYPES_DETAIL_SERIALIZATION_CONTEXT_HPP

#include <pgtypes/errc.hpp>
#include <pgtypes/error_code.hpp>

#include <boost/core/ignore_unused.hpp>
#include <boost/core/span.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace pgtypes {
namespace detail {

// Appends serialized values to a buffer, enforcing a maximum size.
//
// Contains an error that is set if a serialization function fails
// (e.g. because it would overrun the buffer size limit).
// Once set, serializing is a no-op. This pattern allows us to check for errors just once.
class serialization_context
{
    std::vector<std::uint8_t>& buffer_;
    std::size_t max_buffer_size_;
    error_code err_;

    template <class Serializable, class... Rest>
    static constexpr std::size_t fixed_total_size(Serializable, Rest... rest)
    {
        return Serializable::size + fixed_total_size(rest...);
    }

    static constexpr std::size_t fixed_total_size() { return 0u; }

    template <class Serializable, class... Rest>
    static void serialize_fixed_impl(std::uint8_t* it, Serializable serializable, Rest... rest)
    {
        serializable.serialize_fixed(it);
        serialize_fixed_impl(it + Serializable::size, rest...);
    }

    static void serialize_fixed_impl(std::uint8_t*) {}

public:
    explicit serialization_context(
        std::vector<std::uint8_t>& buff,
        std::size_t max_buffer_size = static_cast<std::size_t>(-1)
    ) noexcept
        : buffer_(buff), max_buffer_size_(max_buffer_size)
    {
    }

    // To be called by serialize() functions. Appends bytes to the buffer.
    void add(boost::span<const std::uint8_t> contents)
    {
        // Check if the buffer has space for the given contents
        if (buffer_.size() + contents.size() > max_buffer_size_)
            add_error(errc::max_buffer_size_exceeded);

        // Copy if there was no error
        if (!err_)
            buffer_.insert(buffer_.end(), contents.begin(), contents.end());
    }

    void add(std::uint8_t value) { add(boost::span<const std::uint8_t>(&value, 1)); }

    // Sets the error state
    void add_error(error_code ec)
    {
        if (!err_)
            err_ = ec;
    }

    error_code error() const { return err_; }

    // Optimization for fixed size types. We serialize them to an
    // intermediate, stack-based buffer, then copy them to the actual buffer.
    // This saves reallocations and space checks
    template <class... Serializable>
    void serialize_fixed(Serializable... s)
    {
        std::array<std::uint8_t, fixed_total_size(Serializable{}...)> buff;
        serialize_fixed_impl(buff.data(), s...);
        add(buff);
    }

    // Allow chaining
    template <class... Serializable>
    void serialize(Serializable... s)
    {
        int dummy[] = {0, (s.serialize(*this), 0)...};
        boost::ignore_unused(dummy);
    }
};

}  // namespace detail
}  // namespace pgtypes

#endif

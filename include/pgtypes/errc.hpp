//
// Copyright (c) 2019-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGTYPES_ERRC_HPP
#define PGTYPES_ERRC_HPP

#include <pgtypes/error_code.hpp>

#include <pgtypes/detail/config.hpp>

#include <boost/system/error_category.hpp>

#include <iosfwd>

namespace pgtypes {

/**
 * \brief Error codes produced by pgtypes value operations and codecs.
 */
enum class errc : int
{
    /// A value can't be converted to the requested type (e.g. an infinite timestamp to a time point).
    invalid_cast = 1,

    /// The operation is not defined for the supplied operands (e.g. subtracting infinite timestamps).
    invalid_operation,

    /// A string could not be parsed because its structure is not recognized.
    format_error,

    /**
     * \brief A value is structurally valid but one of its components is out of range,
     * or an arithmetic result does not fit in the destination type.
     */
    overflow,

    /// A required argument was null.
    null_argument,

    /// An argument of an incompatible type was supplied.
    invalid_argument,

    /// The buffer ended before all the fields of a value could be read.
    incomplete_message,

    /// The wire length declared for a value does not match the length its type requires.
    protocol_value_error,

    /// Writing a value would exceed the maximum size of the output buffer.
    max_buffer_size_exceeded,
};

/// Returns the error category for \ref errc.
PGTYPES_DECL
const boost::system::error_category& get_pgtypes_category() noexcept;

/// Creates an \ref error_code from a \ref errc.
inline error_code make_error_code(errc error)
{
    return error_code(static_cast<int>(error), get_pgtypes_category());
}

/// Streams an error code enumerator, using its description.
PGTYPES_DECL
std::ostream& operator<<(std::ostream& os, errc v);

}  // namespace pgtypes

namespace boost {
namespace system {

template <>
struct is_error_code_enum<::pgtypes::errc>
{
    static constexpr bool value = true;
};

}  // namespace system
}  // namespace boost

#ifdef PGTYPES_HEADER_ONLY
#include <pgtypes/impl/error_categories.ipp>
#endif

#endif

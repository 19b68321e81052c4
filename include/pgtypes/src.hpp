//
// Copyright (c) 2019-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGTYPES_SRC_HPP
#define PGTYPES_SRC_HPP

// This file is meant to be included once, in a translation unit of
// the program, with the macro PGTYPES_SEPARATE_COMPILATION defined.

#include <pgtypes/detail/config.hpp>

#ifndef PGTYPES_SEPARATE_COMPILATION
#error You need to define PGTYPES_SEPARATE_COMPILATION in all translation units that use the compiled version of pgtypes, \
    as well as the one where this file is included.
#endif

#include <pgtypes/impl/error_categories.ipp>
#include <pgtypes/impl/local_offset.ipp>
#include <pgtypes/impl/date.ipp>

// circle.ipp uses the point parser
#include <pgtypes/impl/point.ipp>
#include <pgtypes/impl/circle.ipp>

#include <pgtypes/impl/codecs.ipp>
#include <pgtypes/impl/timespan.ipp>
#include <pgtypes/impl/timestamp.ipp>
#include <pgtypes/impl/value_view.ipp>

#endif

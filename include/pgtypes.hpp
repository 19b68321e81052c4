//
// Copyright (c) 2019-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGTYPES_HPP
#define PGTYPES_HPP

#include <pgtypes/bad_value_access.hpp>
#include <pgtypes/circle.hpp>
#include <pgtypes/codecs.hpp>
#include <pgtypes/date.hpp>
#include <pgtypes/errc.hpp>
#include <pgtypes/error_code.hpp>
#include <pgtypes/point.hpp>
#include <pgtypes/string_view.hpp>
#include <pgtypes/timespan.hpp>
#include <pgtypes/timestamp.hpp>
#include <pgtypes/type_oid.hpp>
#include <pgtypes/value_view.hpp>

#endif

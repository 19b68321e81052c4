//
// Copyright (c) 2019-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PGTYPES_DETAIL_CONFIG_HPP
#define PGTYPES_DETAIL_CONFIG_HPP

#include <boost/config.hpp>

// clang-format off

// C++20 calendar types
#if defined(__has_include)
    #if __has_include(<version>)
        #include <version>
        #if defined(__cpp_lib_chrono) && __cpp_lib_chrono >= 201907L
            #define PGTYPES_HAS_LOCAL_TIME
        #endif
    #endif
#endif

// Separate build
#if defined(PGTYPES_SEPARATE_COMPILATION)
    #define PGTYPES_DECL
    #define PGTYPES_STATIC_OR_INLINE static
#else
    #define PGTYPES_HEADER_ONLY
    #define PGTYPES_DECL inline
    #define PGTYPES_STATIC_OR_INLINE inline
#endif

// clang-format on

#endif

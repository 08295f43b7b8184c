// Copyright 2024 The cliargs authors. All rights reserved.
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#ifndef CLIARGS_CONFIG_HPP_INCLUDED
#define CLIARGS_CONFIG_HPP_INCLUDED

// Compile time configuration for cliargs.
// The following macros may be defined before including any cliargs header:
//
// CLIARGS_PLATFORM_WINDOWS : treat '\' as a path separator in argv[0]
//                            (detected automatically)
// CLIARGS_CONFIG_PATH_SEPARATORS : characters after which the program name starts

#define CLIARGS_VERSION_MAJOR 0
#define CLIARGS_VERSION_MINOR 5
#define CLIARGS_VERSION_PATCH 0

#if !defined(CLIARGS_PLATFORM_WINDOWS) && ( defined(WIN32) || defined(__WIN32__) || defined(_WIN32) || defined(_MSC_VER) )
#define CLIARGS_PLATFORM_WINDOWS
#endif

#ifndef CLIARGS_CONFIG_PATH_SEPARATORS
#   ifdef CLIARGS_PLATFORM_WINDOWS
#       define CLIARGS_CONFIG_PATH_SEPARATORS "\\/"
#   else
#       define CLIARGS_CONFIG_PATH_SEPARATORS "/"
#   endif
#endif

#endif // CLIARGS_CONFIG_HPP_INCLUDED

// Copyright 2024 The cliargs authors. All rights reserved.
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#ifndef CLIARGS_TEST_HELPERS_HPP_INCLUDED
#define CLIARGS_TEST_HELPERS_HPP_INCLUDED

#include "cliargs.hpp"

#include <catch2/catch.hpp>

#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace Catch {
template<typename T>
struct StringMaker<cliargs::BasicResult<T>> {
    static std::string convert( cliargs::BasicResult<T> const& result ) {
        switch( result.type() ) {
            case cliargs::ResultBase::Ok:
                return "Ok";
            case cliargs::ResultBase::LogicError:
                return "LogicError '" + result.errorMessage() + "'";
            case cliargs::ResultBase::RuntimeError:
                return "RuntimeError '" + result.errorMessage() + "'";
            default:
                return "Unknown type: " + std::to_string( static_cast<int>( result.type() ) );
        }
    }
};
}

using Views = std::vector<std::string_view>;

template<typename T>
inline std::string toString( T const& value ) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

#endif // CLIARGS_TEST_HELPERS_HPP_INCLUDED

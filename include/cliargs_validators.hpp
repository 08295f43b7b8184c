// Copyright 2024 The cliargs authors. All rights reserved.
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#ifndef CLIARGS_VALIDATORS_HPP_INCLUDED
#define CLIARGS_VALIDATORS_HPP_INCLUDED

#include "cliargs_result.hpp"

#include <cstdint>
#include <limits>
#include <locale>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>

namespace cliargs {
namespace detail {

    template<typename T>
    struct IsNumber : std::integral_constant<bool,
        ( std::is_integral<T>::value && !std::is_same<T, bool>::value && !std::is_same<T, char>::value && sizeof( T ) <= 8 )
        || std::is_same<T, float>::value
        || std::is_same<T, double>::value> {};

    template<typename T>
    inline auto parseInteger( std::string_view text, T &out, std::string &details ) -> bool {
        if( text.empty() ) {
            details = "cannot parse integer from empty string";
            return false;
        }

        std::size_t i = 0;
        bool negative = false;
        if( text[0] == '+' || ( std::is_signed<T>::value && text[0] == '-' ) ) {
            negative = text[0] == '-';
            i = 1;
            if( text.size() == 1 ) {
                details = "invalid digit found in string";
                return false;
            }
        }

        constexpr T max = std::numeric_limits<T>::max();
        constexpr T min = std::numeric_limits<T>::min();
        T value = 0;
        for( ; i < text.size(); ++i ) {
            char c = text[i];
            if( c < '0' || c > '9' ) {
                details = "invalid digit found in string";
                return false;
            }
            T digit = static_cast<T>( c - '0' );
            if( negative ) {
                if( value < static_cast<T>( ( min + digit ) / 10 ) ) {
                    details = "number too small to fit in target type";
                    return false;
                }
                value = static_cast<T>( value * 10 - digit );
            } else {
                if( value > static_cast<T>( ( max - digit ) / 10 ) ) {
                    details = "number too large to fit in target type";
                    return false;
                }
                value = static_cast<T>( value * 10 + digit );
            }
        }
        out = value;
        return true;
    }

    inline auto equalsIgnoreCase( std::string_view text, std::string_view lower ) -> bool {
        if( text.size() != lower.size() )
            return false;
        for( std::size_t i = 0; i < text.size(); ++i ) {
            char c = text[i];
            if( c >= 'A' && c <= 'Z' )
                c = static_cast<char>( c - 'A' + 'a' );
            if( c != lower[i] )
                return false;
        }
        return true;
    }

    // [+-]? ( inf | infinity | nan | digits [ . digits? ] | . digits ) ( [eE] [+-]? digits )?
    inline auto isFloatLiteral( std::string_view text ) -> bool {
        std::size_t i = 0;
        if( i < text.size() && ( text[i] == '+' || text[i] == '-' ) )
            ++i;

        auto rest = text.substr( i );
        if( equalsIgnoreCase( rest, "inf" ) || equalsIgnoreCase( rest, "infinity" ) || equalsIgnoreCase( rest, "nan" ) )
            return true;

        auto isDigit = []( char c ) { return c >= '0' && c <= '9'; };
        std::size_t mantissaDigits = 0;
        while( i < text.size() && isDigit( text[i] ) ) {
            ++i;
            ++mantissaDigits;
        }
        if( i < text.size() && text[i] == '.' ) {
            ++i;
            while( i < text.size() && isDigit( text[i] ) ) {
                ++i;
                ++mantissaDigits;
            }
        }
        if( mantissaDigits == 0 )
            return false;

        if( i < text.size() && ( text[i] == 'e' || text[i] == 'E' ) ) {
            ++i;
            if( i < text.size() && ( text[i] == '+' || text[i] == '-' ) )
                ++i;
            std::size_t exponentDigits = 0;
            while( i < text.size() && isDigit( text[i] ) ) {
                ++i;
                ++exponentDigits;
            }
            if( exponentDigits == 0 )
                return false;
        }
        return i == text.size();
    }

    // Values beyond the representable range become infinity. The text is
    // read in the classic locale whatever the global locale is.
    template<typename T>
    inline auto parseFloat( std::string_view text, T &out, std::string &details ) -> bool {
        if( text.empty() ) {
            details = "cannot parse float from empty string";
            return false;
        }
        if( !isFloatLiteral( text ) ) {
            details = "invalid float literal";
            return false;
        }

        bool negative = text[0] == '-';
        auto magnitude = text[0] == '-' || text[0] == '+' ? text.substr( 1 ) : text;
        if( equalsIgnoreCase( magnitude, "nan" ) ) {
            out = std::numeric_limits<T>::quiet_NaN();
            return true;
        }
        if( equalsIgnoreCase( magnitude, "inf" ) || equalsIgnoreCase( magnitude, "infinity" ) ) {
            out = negative ? -std::numeric_limits<T>::infinity() : std::numeric_limits<T>::infinity();
            return true;
        }

        std::istringstream ss{ std::string( text ) };
        ss.imbue( std::locale::classic() );
        T value{};
        ss >> value;
        if( ss.fail() ) {
            // The literal is well formed, so the stream only fails out of range
            if( value == T( 0 ) )
                value = negative ? -T( 0 ) : T( 0 );
            else
                value = negative ? -std::numeric_limits<T>::infinity() : std::numeric_limits<T>::infinity();
        }
        out = value;
        return true;
    }

    // Parses `text` as T with its full range. On failure `details` receives
    // a short reason and `out` is left untouched.
    template<typename T>
    inline auto parseNumber( std::string_view text, T &out, std::string &details ) -> bool {
        static_assert( IsNumber<T>::value, "parseNumber supports 8 to 64 bit integers, float and double" );
        if constexpr( std::is_floating_point<T>::value )
            return parseFloat( text, out, details );
        else
            return parseInteger( text, out, details );
    }

    template<typename T>
    inline auto validateNumber( std::string_view storeKey, std::string_view option, std::string_view optArg ) -> Result {
        T value{};
        std::string details;
        if( parseNumber( optArg, value, details ) )
            return Result::ok();
        return Result::fail( Error::optionArgIsInvalid(
            std::string( option ), std::string( storeKey ), std::string( optArg ), details ) );
    }

} // namespace detail
} // namespace cliargs

#endif // CLIARGS_VALIDATORS_HPP_INCLUDED

// Copyright 2024 The cliargs authors. All rights reserved.
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#ifndef CLIARGS_TOKEN_HPP_INCLUDED
#define CLIARGS_TOKEN_HPP_INCLUDED

#include "cliargs_text.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace cliargs {
namespace detail {

    inline auto isAsciiAlpha( char32_t c ) -> bool {
        return ( c >= 'a' && c <= 'z' ) || ( c >= 'A' && c <= 'Z' );
    }

    inline auto isAllowedFirstChar( char32_t c ) -> bool {
        return isAsciiAlpha( c );
    }

    inline auto isAllowedChar( char32_t c ) -> bool {
        return isAsciiAlpha( c ) || ( c >= '0' && c <= '9' ) || c == '-';
    }

    enum class TokenType {
        EndOfOptions, LongOption, ShortCluster, BareDash, Positional
    };

    // One candidate short option inside a cluster. `name` holds all the
    // bytes of a code point so a non-ASCII character is reported whole.
    struct ShortName {
        std::string_view name;
        bool valid;
    };

    // The classification of a single argument. All views point into the
    // argument that was recognised.
    struct Token {
        TokenType type;
        std::string_view text;

        // LongOption: the name after "--" up to the first '='.
        // If `valid` is false it is the whole text after "--".
        std::string_view name;
        bool valid = true;

        std::vector<ShortName> shortNames;

        // Present only when an '=' was consumed inside the token
        std::optional<std::string_view> inlineValue;
    };

    inline auto recogniseLong( std::string_view arg ) -> Token {
        Token token{ TokenType::LongOption, arg };
        auto body = arg.substr( 2 );

        std::size_t pos = 0;
        while( pos < body.size() ) {
            auto start = pos;
            char32_t cp = 0;
            bool decoded = decodeUtf8( body, pos, cp );
            if( decoded && cp == '=' && start > 0 ) {
                token.name = body.substr( 0, start );
                token.inlineValue = body.substr( start + 1 );
                return token;
            }
            bool allowed = decoded && ( start == 0 ? isAllowedFirstChar( cp ) : isAllowedChar( cp ) );
            if( !allowed ) {
                token.name = body;
                token.valid = false;
                return token;
            }
        }
        token.name = body;
        return token;
    }

    inline auto recogniseShort( std::string_view arg ) -> Token {
        Token token{ TokenType::ShortCluster, arg };
        auto body = arg.substr( 1 );

        std::size_t pos = 0;
        while( pos < body.size() ) {
            auto start = pos;
            char32_t cp = 0;
            bool decoded = decodeUtf8( body, pos, cp );
            if( decoded && cp == '=' && start > 0 ) {
                token.inlineValue = body.substr( start + 1 );
                return token;
            }
            token.shortNames.push_back( { body.substr( start, pos - start ), decoded && isAllowedFirstChar( cp ) } );
        }
        return token;
    }

    // Classifies one argument:
    //
    //   "--"               EndOfOptions
    //   "--name[=value]"   LongOption
    //   "-"                BareDash
    //   "-abc[=value]"     ShortCluster
    //   anything else      Positional
    inline auto recognise( std::string_view arg ) -> Token {
        if( arg.size() >= 2 && arg[0] == '-' && arg[1] == '-' ) {
            if( arg.size() == 2 )
                return Token{ TokenType::EndOfOptions, arg };
            return recogniseLong( arg );
        }
        if( !arg.empty() && arg[0] == '-' ) {
            if( arg.size() == 1 )
                return Token{ TokenType::BareDash, arg };
            return recogniseShort( arg );
        }
        return Token{ TokenType::Positional, arg };
    }

} // namespace detail
} // namespace cliargs

#endif // CLIARGS_TOKEN_HPP_INCLUDED

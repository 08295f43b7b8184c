// Copyright 2024 The cliargs authors. All rights reserved.
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#ifndef CLIARGS_TEXT_HPP_INCLUDED
#define CLIARGS_TEXT_HPP_INCLUDED

#include <cstddef>
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

namespace cliargs {
namespace detail {

    // Decodes the UTF-8 sequence starting at `pos`. On success the code point is
    // written to `cp` and `pos` is moved past the sequence. On failure `pos` is
    // moved past the offending lead byte and false is returned.
    inline auto decodeUtf8( std::string_view text, std::size_t &pos, char32_t &cp ) -> bool {
        auto lead = static_cast<unsigned char>( text[pos] );
        std::size_t len;
        char32_t min;
        if( lead < 0x80 ) {
            cp = lead;
            ++pos;
            return true;
        }
        else if( ( lead & 0xE0 ) == 0xC0 ) { len = 2; cp = lead & 0x1F; min = 0x80; }
        else if( ( lead & 0xF0 ) == 0xE0 ) { len = 3; cp = lead & 0x0F; min = 0x800; }
        else if( ( lead & 0xF8 ) == 0xF0 ) { len = 4; cp = lead & 0x07; min = 0x10000; }
        else {
            ++pos;
            return false;
        }

        if( pos + len > text.size() ) {
            ++pos;
            return false;
        }
        for( std::size_t i = 1; i < len; ++i ) {
            auto c = static_cast<unsigned char>( text[pos + i] );
            if( ( c & 0xC0 ) != 0x80 ) {
                ++pos;
                return false;
            }
            cp = ( cp << 6 ) | ( c & 0x3F );
        }
        // overlong forms, surrogates and values past the last plane
        if( cp < min || ( cp >= 0xD800 && cp <= 0xDFFF ) || cp > 0x10FFFF ) {
            ++pos;
            return false;
        }
        pos += len;
        return true;
    }

    inline auto isValidUtf8( std::string_view text ) -> bool {
        std::size_t pos = 0;
        char32_t cp;
        while( pos < text.size() ) {
            if( !decodeUtf8( text, pos, cp ) )
                return false;
        }
        return true;
    }

    inline void appendUtf8( std::string &out, char32_t cp ) {
        if( cp < 0x80 ) {
            out += static_cast<char>( cp );
        } else if( cp < 0x800 ) {
            out += static_cast<char>( 0xC0 | ( cp >> 6 ) );
            out += static_cast<char>( 0x80 | ( cp & 0x3F ) );
        } else if( cp < 0x10000 ) {
            out += static_cast<char>( 0xE0 | ( cp >> 12 ) );
            out += static_cast<char>( 0x80 | ( ( cp >> 6 ) & 0x3F ) );
            out += static_cast<char>( 0x80 | ( cp & 0x3F ) );
        } else {
            out += static_cast<char>( 0xF0 | ( cp >> 18 ) );
            out += static_cast<char>( 0x80 | ( ( cp >> 12 ) & 0x3F ) );
            out += static_cast<char>( 0x80 | ( ( cp >> 6 ) & 0x3F ) );
            out += static_cast<char>( 0x80 | ( cp & 0x3F ) );
        }
    }

    // Invalid bytes are replaced with U+FFFD
    inline auto toLossyUtf8( std::string_view text ) -> std::string {
        std::string out;
        out.reserve( text.size() );
        std::size_t pos = 0;
        char32_t cp;
        while( pos < text.size() ) {
            if( decodeUtf8( text, pos, cp ) )
                appendUtf8( out, cp );
            else
                appendUtf8( out, 0xFFFD );
        }
        return out;
    }

    struct CodePointRange {
        char32_t first;
        char32_t last;
    };

    template<std::size_t N>
    inline auto inRanges( char32_t cp, CodePointRange const (&ranges)[N] ) -> bool {
        for( auto const &r : ranges ) {
            if( cp < r.first )
                return false;
            if( cp <= r.last )
                return true;
        }
        return false;
    }

    // Number of terminal cells occupied by a code point
    inline auto charWidth( char32_t cp ) -> std::size_t {
        static constexpr CodePointRange zeroWidth[] = {
            { 0x0300, 0x036F }, { 0x0483, 0x0489 }, { 0x0591, 0x05BD },
            { 0x0610, 0x061A }, { 0x064B, 0x065F }, { 0x0E31, 0x0E31 },
            { 0x0E34, 0x0E3A }, { 0x0E47, 0x0E4E }, { 0x1AB0, 0x1AFF },
            { 0x1DC0, 0x1DFF }, { 0x200B, 0x200F }, { 0x2028, 0x202E },
            { 0x2060, 0x2064 }, { 0x20D0, 0x20FF }, { 0x302A, 0x302D },
            { 0x3099, 0x309A }, { 0xFE00, 0xFE0F }, { 0xFE20, 0xFE2F },
            { 0xFEFF, 0xFEFF }, { 0xE0100, 0xE01EF }
        };
        static constexpr CodePointRange doubleWidth[] = {
            { 0x1100, 0x115F }, { 0x231A, 0x231B }, { 0x2329, 0x232A },
            { 0x23E9, 0x23EC }, { 0x25FD, 0x25FE }, { 0x2614, 0x2615 },
            { 0x2E80, 0x303E }, { 0x3041, 0x3247 }, { 0x3250, 0x4DBF },
            { 0x4E00, 0xA4CF }, { 0xA960, 0xA97F }, { 0xAC00, 0xD7A3 },
            { 0xF900, 0xFAFF }, { 0xFE10, 0xFE19 }, { 0xFE30, 0xFE6F },
            { 0xFF00, 0xFF60 }, { 0xFFE0, 0xFFE6 }, { 0x16FE0, 0x16FE4 },
            { 0x17000, 0x18CFF }, { 0x1B000, 0x1B2FF }, { 0x1F004, 0x1F004 },
            { 0x1F0CF, 0x1F0CF }, { 0x1F18E, 0x1F18E }, { 0x1F191, 0x1F19A },
            { 0x1F200, 0x1F251 }, { 0x1F300, 0x1F64F }, { 0x1F680, 0x1F6FF },
            { 0x1F7E0, 0x1F7EB }, { 0x1F90C, 0x1F9FF }, { 0x1FA70, 0x1FAFF },
            { 0x20000, 0x2FFFD }, { 0x30000, 0x3FFFD }
        };

        if( cp < 0x20 || ( cp >= 0x7F && cp < 0xA0 ) )
            return 0;
        if( cp < 0x300 )
            return 1;
        if( inRanges( cp, zeroWidth ) )
            return 0;
        if( inRanges( cp, doubleWidth ) )
            return 2;
        return 1;
    }

    // Display width of a string in terminal cells. Invalid bytes count as one cell.
    inline auto textWidth( std::string_view text ) -> std::size_t {
        std::size_t width = 0;
        std::size_t pos = 0;
        char32_t cp;
        while( pos < text.size() ) {
            if( decodeUtf8( text, pos, cp ) )
                width += charWidth( cp );
            else
                ++width;
        }
        return width;
    }

    // Quotes-safe rendering used in error messages and debug output
    inline auto escape( std::string_view text ) -> std::string {
        std::string out;
        out.reserve( text.size() );
        for( char c : text ) {
            switch( c ) {
                case '\\': out += "\\\\"; break;
                case '"':  out += "\\\""; break;
                case '\n': out += "\\n"; break;
                case '\r': out += "\\r"; break;
                case '\t': out += "\\t"; break;
                case '\0': out += "\\0"; break;
                default:
                    if( static_cast<unsigned char>( c ) < 0x20 || c == 0x7F ) {
                        char buf[12];
                        std::snprintf( buf, sizeof( buf ), "\\u{%x}", static_cast<unsigned>( c ) );
                        out += buf;
                    } else {
                        out += c;
                    }
            }
        }
        return out;
    }

    inline auto trim( std::string_view text ) -> std::string_view {
        auto isSpace = []( char c ) {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
        };
        std::size_t begin = 0;
        std::size_t end = text.size();
        while( begin < end && isSpace( text[begin] ) )
            ++begin;
        while( end > begin && isSpace( text[end - 1] ) )
            --end;
        return text.substr( begin, end - begin );
    }

    // Splits on '\n'. An empty text yields one empty line.
    inline auto splitLines( std::string_view text ) -> std::vector<std::string_view> {
        std::vector<std::string_view> lines;
        std::size_t start = 0;
        for(;;) {
            auto nl = text.find( '\n', start );
            if( nl == std::string_view::npos ) {
                lines.push_back( text.substr( start ) );
                break;
            }
            lines.push_back( text.substr( start, nl - start ) );
            start = nl + 1;
        }
        return lines;
    }

} // namespace detail
} // namespace cliargs

#endif // CLIARGS_TEXT_HPP_INCLUDED

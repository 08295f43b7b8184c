// Copyright 2024 The cliargs authors. All rights reserved.
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#ifndef CLIARGS_HELP_HPP_INCLUDED
#define CLIARGS_HELP_HPP_INCLUDED

#include "cliargs_opt_cfg.hpp"
#include "cliargs_text.hpp"

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cliargs {
namespace detail {

    // Returns the number of leading spaces and the title of an option, e.g.
    //
    //   names { "", "f", "", "foo-bar" }, argInHelp "<n>"  ->  ( 4, "-f,     --foo-bar <n>" )
    //
    // Empty names before the first real name add four spaces of leading pad and
    // empty names between real names widen the gap after the comma, so that
    // options line up in columns.
    inline auto makeOptTitle( OptCfg const &cfg ) -> std::pair<std::size_t, std::string> {
        std::size_t headSpaces = 0;
        std::size_t lastSpaces = 0;
        std::string title;
        bool useStoreKey = true;

        auto appendName = [&]( std::string const &name ) {
            if( lastSpaces > 0 ) {
                title += ',';
                title.append( lastSpaces - 1, ' ' );
            }
            title += name.size() == 1 ? "-" : "--";
            title += name;
        };

        auto const &names = cfg.names();
        auto n = names.size();
        for( std::size_t i = 0; i < n; ++i ) {
            auto const &name = names[i];
            if( name.empty() ) {
                if( title.empty() )
                    headSpaces += 4;
                else if( i != n - 1 )
                    lastSpaces += 4;
                else
                    lastSpaces += 2;
                continue;
            }
            appendName( name );
            lastSpaces = i != n - 1 ? 2 : 0;
            useStoreKey = false;
        }

        if( useStoreKey && !cfg.storeKey().empty() )
            appendName( cfg.storeKey() );

        if( !cfg.argInHelp().empty() ) {
            title += ' ';
            title += cfg.argInHelp();
        }

        return { headSpaces, title };
    }

    inline void appendDesc( std::string &text, std::string const &desc, std::size_t indent ) {
        auto lines = splitLines( desc );
        for( std::size_t i = 0; i < lines.size(); ++i ) {
            if( i > 0 ) {
                text += '\n';
                text.append( indent, ' ' );
            }
            text += lines[i];
        }
    }

    // Renders one entry per option: the number of leading spaces and the text.
    // An indent of 0 is replaced with the widest title + 2. Descriptions start
    // at the indent column, or on the next line when the title reaches it.
    inline auto createOptsHelp( std::vector<OptCfg> const &cfgs, std::size_t &indent ) -> std::vector<std::pair<std::size_t, std::string>> {
        std::vector<std::pair<std::size_t, std::string>> entries;
        std::vector<std::size_t> widths;
        std::vector<OptCfg const*> shown;

        for( auto const &cfg : cfgs ) {
            if( cfg.isIgnored() || cfg.isWildcard() )
                continue;
            auto entry = makeOptTitle( cfg );
            widths.push_back( entry.first + textWidth( entry.second ) );
            entries.push_back( std::move( entry ) );
            shown.push_back( &cfg );
        }

        if( indent == 0 ) {
            for( auto width : widths ) {
                if( indent < width )
                    indent = width;
            }
            indent += 2;
        }

        for( std::size_t i = 0; i < entries.size(); ++i ) {
            auto const &desc = shown[i]->desc();
            if( desc.empty() )
                continue;
            auto &text = entries[i].second;
            if( widths[i] + 2 > indent ) {
                text += '\n';
                text.append( indent, ' ' );
            } else {
                text.append( indent - widths[i], ' ' );
            }
            appendDesc( text, desc, indent );
        }

        return entries;
    }

    // Collects blocks of text and option descriptions into printable lines
    //
    //   Help help;
    //   help.addText( "Usage: app [OPTIONS] FILE" );
    //   help.addOptsWithMargin( cmd.cfgs(), 2 );
    //   std::cout << help;
    class Help {
        std::size_t m_margin;
        std::vector<std::string> m_lines;

        void addLine( std::size_t pad, std::string_view line ) {
            std::string out( pad, ' ' );
            out += line;
            m_lines.push_back( std::move( out ) );
        }

    public:
        explicit Help( std::size_t margin = 0 ) : m_margin( margin ) {}

        auto addText( std::string const &text ) -> Help & {
            return addTextWithIndent( text, 0 );
        }

        // The indent applies to the second and later lines
        auto addTextWithIndent( std::string const &text, std::size_t indent ) -> Help & {
            auto lines = splitLines( text );
            for( std::size_t i = 0; i < lines.size(); ++i )
                addLine( m_margin + ( i > 0 ? indent : 0 ), lines[i] );
            return *this;
        }

        auto addTextWithMargin( std::string const &text, std::size_t margin ) -> Help & {
            for( auto line : splitLines( text ) )
                addLine( m_margin + margin, line );
            return *this;
        }

        auto addOpts( std::vector<OptCfg> const &cfgs ) -> Help & {
            return addOptsWithIndentAndMargin( cfgs, 0, 0 );
        }

        auto addOptsWithIndent( std::vector<OptCfg> const &cfgs, std::size_t indent ) -> Help & {
            return addOptsWithIndentAndMargin( cfgs, indent, 0 );
        }

        auto addOptsWithMargin( std::vector<OptCfg> const &cfgs, std::size_t margin ) -> Help & {
            return addOptsWithIndentAndMargin( cfgs, 0, margin );
        }

        auto addOptsWithIndentAndMargin( std::vector<OptCfg> const &cfgs, std::size_t indent, std::size_t margin ) -> Help & {
            for( auto const &entry : createOptsHelp( cfgs, indent ) ) {
                auto lines = splitLines( entry.second );
                for( std::size_t i = 0; i < lines.size(); ++i )
                    addLine( m_margin + margin + ( i == 0 ? entry.first : 0 ), lines[i] );
            }
            return *this;
        }

        auto lines() const -> std::vector<std::string> const& { return m_lines; }

        void writeToStream( std::ostream &os ) const {
            for( auto const &line : m_lines )
                os << line << '\n';
        }

        friend auto operator<<( std::ostream &os, Help const &help ) -> std::ostream& {
            help.writeToStream( os );
            return os;
        }
    };

} // namespace detail
} // namespace cliargs

#endif // CLIARGS_HELP_HPP_INCLUDED
